#include <iostream>
#include <string>
#include <vector>

#include "AnalysisConfiguration.h"
#include "QMCAnalysis.h"
#include "ResultsSerializer.h"
#include "SampleTableJsonReader.h"

using namespace qmc_sensitivity;
using namespace qmc_sensitivity::analysis;

static void usage()
{
  std::cerr << "Usage: qmcanalyzer <config.json> <samples.json> [samples.json ...]\n"
            << "\n"
            << "  With one sample file the runs are analysed directly; with several\n"
            << "  they are concatenated in the given order and analysed as one set.\n"
            << "  Results are written to stdout as JSON, progress to stderr.\n";
}

int main(int argc, char** argv)
{
  if (argc < 3)
    {
      usage();
      return 1;
    }

  try
    {
      const ConfigurationFile config = ConfigurationFileReader::readFile(argv[1]);

      std::clog << QMCAnalysis::elementName() << " " << QMCAnalysis::elementVersion()
                << ": " << config.sampler.numParameters() << " parameters, alpha = "
                << config.analysis.getAlpha() << ", n_bootstrap = "
                << config.analysis.getNumBootstrap() << "\n";

      QMCAnalysis analysis(config.sampler, config.analysis, std::clog);

      std::vector<CampaignSamples> campaigns;
      for (int i = 2; i < argc; ++i)
        campaigns.push_back(CampaignSamples{ config.sampler.parameterNames,
                                             SampleTableJsonReader::readFile(argv[i]) });

      const AnalysisResults results = (campaigns.size() == 1)
        ? analysis.analyse(campaigns.front().samples)
        : analysis.merge(campaigns);

      std::cout << ResultsSerializer::toJson(results) << std::endl;
    }
  catch (const SensitivityAnalysisException& e)
    {
      std::cerr << "qmcanalyzer: " << e.what() << std::endl;
      return 1;
    }
  catch (const std::exception& e)
    {
      std::cerr << "qmcanalyzer: unexpected error: " << e.what() << std::endl;
      return 1;
    }

  return 0;
}
