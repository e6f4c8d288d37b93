#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "SensitivityException.h"

namespace qmc_sensitivity
{
  namespace rng_utils
  {
    // --- Detection: does Rng wrap its engine behind .engine()? ---
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    // Reference to the underlying engine, whether wrapped or direct.
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();
      else
	return rng;
    }

    /**
     * @brief Uniform index in [0, hiExclusive) without modulo bias.
     *
     * @pre hiExclusive > 0
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(get_engine(rng));
    }

    inline std::uint64_t splitmix64(std::uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    inline std::uint64_t hash_combine64(std::initializer_list<std::uint64_t> parts)
    {
      std::uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts) h = splitmix64(h ^ v);
      return h;
    }

    // Expand a 64-bit seed into eight 32-bit seed_seq words
    inline std::seed_seq make_seed_seq(std::uint64_t seed64)
    {
      const std::uint64_t s0 = seed64;
      const std::uint64_t s1 = splitmix64(s0);
      const std::uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
      const std::uint64_t s3 = splitmix64(s1 + 0xd1342543de82ef95ull);

      std::array<std::uint32_t, 8> words = {
	static_cast<std::uint32_t>(s0), static_cast<std::uint32_t>(s0 >> 32),
	static_cast<std::uint32_t>(s1), static_cast<std::uint32_t>(s1 >> 32),
	static_cast<std::uint32_t>(s2), static_cast<std::uint32_t>(s2 >> 32),
	static_cast<std::uint32_t>(s3), static_cast<std::uint32_t>(s3 >> 32)
      };

      return std::seed_seq(words.begin(), words.end());
    }

    template<class Eng>
    inline Eng construct_seeded_engine(std::seed_seq& sseq)
    {
      if constexpr (std::is_constructible_v<Eng, std::seed_seq&>)
	{
	  return Eng(sseq);
	}
      else
	{
	  Eng e;
	  e.seed(sseq);
	  return e;
	}
    }

    /**
     * @brief Master seed plus a path of tags, e.g. the position of the QoI
     * being analysed. Each distinct path yields an independent, reproducible
     * engine.
     */
    class SeedKey
    {
    public:
      explicit SeedKey(std::uint64_t masterSeed, std::vector<std::uint64_t> tags = {})
	: m_masterSeed(masterSeed), m_tags(std::move(tags))
      {}

      SeedKey with_tag(std::uint64_t tag) const
      {
	auto t = m_tags; t.push_back(tag);
	return SeedKey(m_masterSeed, std::move(t));
      }

      std::uint64_t masterSeed() const noexcept { return m_masterSeed; }
      const std::vector<std::uint64_t>& tags() const noexcept { return m_tags; }

      std::uint64_t derived_seed() const
      {
	std::uint64_t h = m_masterSeed;
	for (auto v : m_tags) h = hash_combine64({h, v});
	return h;
      }

      template<class Eng = std::mt19937_64>
      Eng make_engine() const
      {
	auto sseq = make_seed_seq(derived_seed());
	return construct_seeded_engine<Eng>(sseq);
      }

    private:
      std::uint64_t              m_masterSeed;
      std::vector<std::uint64_t> m_tags;
    };

    // Fresh 64-bit master seed from the system entropy source
    inline std::uint64_t entropy_seed()
    {
      std::random_device rd;
      return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
    }
  } // namespace rng_utils

  /**
   * @brief The n_mc x n_bootstrap matrix of resampled row indices.
   *
   * Column b is bootstrap trial b: the n_mc rows of f_M2, f_M1 and every f_Ni
   * that make up that trial. One matrix is shared by all parameters and both
   * index types, so every replicate of one trial sees the same rows.
   * Storage is trial-major so a trial is one contiguous index list.
   */
  class BootstrapIndexMatrix
  {
  public:
    BootstrapIndexMatrix() = default;

    /**
     * @param trials one index list of length n_mc per bootstrap trial
     * @throws ConfigError if there are no trials
     * @throws ShapeError if the trials differ in length or an index is >= numSamples
     */
    BootstrapIndexMatrix(std::vector<std::vector<std::size_t>> trials, std::size_t numSamples)
      : m_trials(std::move(trials)),
        m_numSamples(numSamples)
    {
      if (m_trials.empty())
	throw ConfigError("BootstrapIndexMatrix: at least one bootstrap trial is required");

      for (const auto& t : m_trials)
	{
	  if (t.size() != m_numSamples)
	    throw ShapeError("BootstrapIndexMatrix: trial has " + std::to_string(t.size())
			     + " indices, expected " + std::to_string(m_numSamples));
	  for (std::size_t idx : t)
	    if (idx >= m_numSamples)
	      throw ShapeError("BootstrapIndexMatrix: index " + std::to_string(idx)
			       + " out of range for " + std::to_string(m_numSamples) + " samples");
	}
    }

    std::size_t numSamples() const noexcept { return m_numSamples; }
    std::size_t numTrials() const noexcept { return m_trials.size(); }

    const std::vector<std::size_t>& trial(std::size_t b) const { return m_trials[b]; }

    /// Element (i, b) of the n_mc x n_bootstrap view.
    std::size_t operator()(std::size_t i, std::size_t b) const { return m_trials[b][i]; }

  private:
    std::vector<std::vector<std::size_t>> m_trials;
    std::size_t                           m_numSamples = 0;
  };

  /**
   * @brief Draw an n_mc x n_bootstrap index matrix uniformly with replacement.
   *
   * Indices are drawn row by row (i outer, b inner) from the supplied engine,
   * so the same engine state always yields the same matrix.
   */
  template <class Rng>
  BootstrapIndexMatrix drawBootstrapIndices(std::size_t numSamples,
					    std::size_t numBootstrap,
					    Rng&        rng)
  {
    if (numSamples == 0)
      throw ShapeError("drawBootstrapIndices: no samples to resample");
    if (numBootstrap == 0)
      throw ConfigError("drawBootstrapIndices: n_bootstrap must be positive");

    std::vector<std::vector<std::size_t>> trials(numBootstrap, std::vector<std::size_t>(numSamples));
    for (std::size_t i = 0; i < numSamples; ++i)
      for (std::size_t b = 0; b < numBootstrap; ++b)
	trials[b][i] = rng_utils::get_random_index(rng, numSamples);

    return BootstrapIndexMatrix(std::move(trials), numSamples);
  }

} // namespace qmc_sensitivity
