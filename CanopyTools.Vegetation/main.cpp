#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <gdal_priv.h>

#include <CanopyTools.Common/IO/IO.h>
#include <CanopyTools.Common/IO/Logger.h>
#include <CanopyTools.Common/IO/Reporter.h>
#include <CanopyTools.Traits/ExperimentMetadata.h>
#include <CanopyTools.Traits/TraitResolver.h>

#include "Configuration.h"
#include "Process.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using namespace CanopyTools::IO;
using namespace CanopyTools::Traits;
using namespace CanopyTools::Vegetation;

namespace
{
boost::optional<std::string> optionalValue(const po::variables_map& vm, const char* name)
{
	if (!vm.count(name))
		return boost::none;
	return vm[name].as<std::string>();
}
} // anonymous

int main(int argc, char* argv[]) try
{
	std::vector<std::string> inputPaths;
	std::vector<std::string> metadataPaths;
	std::string workingSpace = fs::current_path().string();
	Variant variant = Variant::Standard;

	// Read console arguments
	po::options_description desc("Allowed options");
	desc.add_options()
		("input,i", po::value<std::vector<std::string>>(&inputPaths), "candidate image file(s)")
		("working-space,w", po::value<std::string>(&workingSpace)->default_value(workingSpace), "output directory path")
		("metadata,m", po::value<std::vector<std::string>>(&metadataPaths), "experiment metadata JSON file(s)")
		("timestamp", po::value<std::string>(), "ISO 8601 timestamp of the run")
		("species", po::value<std::string>(), "species of the plots")
		("germplasm-name", po::value<std::string>(), "germplasm name of the plots")
		("citation-author", po::value<std::string>(), "author of the citation")
		("citation-title", po::value<std::string>(), "title of the citation")
		("citation-year", po::value<std::string>(), "year of the citation")
		("variant", po::value<Variant>(&variant)->default_value(variant),
			"output variant\n"
			"  standard: local time, cover, species, site and method\n"
			"  extended: citation fields and geostream file")
		("verbose,v", "verbose output")
		("debug,d", "debug output")
		("quiet,q", "suppress progress output")
		("version", "produce version message")
		("help,h", "produce help message");

	po::positional_options_description pos;
	pos.add("input", -1);

	po::variables_map vm;
	po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
	po::notify(vm);

	// Argument validation
	if (vm.count("help"))
	{
		std::cout << Transformer::Name << " " << Transformer::Version << std::endl
		          << Transformer::Description << std::endl;
		std::cout << desc << std::endl;
		return Success;
	}

	if (vm.count("version"))
	{
		std::cout << Transformer::Name << " " << Transformer::Version << std::endl
		          << Transformer::Description << std::endl
		          << "Sensor: " << Transformer::SensorName << std::endl
		          << "Type: " << Transformer::TransformerType << std::endl;
		return Success;
	}

	bool argumentError = false;
	if (fs::exists(workingSpace) && !fs::is_directory(workingSpace))
	{
		std::cerr << "The given working space exists but is not a directory." << std::endl;
		argumentError = true;
	}
	else if (!fs::exists(workingSpace) && !fs::create_directories(workingSpace))
	{
		std::cerr << "Failed to create working space." << std::endl;
		argumentError = true;
	}

	for (const std::string& path : metadataPaths)
	{
		if (!fs::is_regular_file(path))
		{
			std::cerr << "The metadata file '" << path << "' does not exist." << std::endl;
			argumentError = true;
		}
	}

	if (argumentError)
	{
		std::cerr << "Use the --help option for description." << std::endl;
		return InvalidInput;
	}

	Process::checkContinue(inputPaths);

	// Logging
	Logger::Level level = Logger::Warning;
	if (vm.count("debug"))
		level = Logger::Debug;
	else if (vm.count("verbose"))
		level = Logger::Info;
	else if (vm.count("quiet"))
		level = Logger::Error;
	ConsoleLogger logger(level);

	// Program
	std::unique_ptr<Reporter> reporter;
	if (vm.count("quiet"))
		reporter.reset(new NullReporter());
	else if (vm.count("verbose") || vm.count("debug"))
		reporter.reset(new TextReporter());
	else
		reporter.reset(new BarReporter());

	if (!vm.count("quiet"))
		std::cerr << "=== Canopy Cover (" << variant << ") ===" << std::endl;

	RunArguments arguments;
	arguments.species = optionalValue(vm, "species");
	arguments.germplasmName = optionalValue(vm, "germplasm-name");
	arguments.citationAuthor = optionalValue(vm, "citation-author");
	arguments.citationTitle = optionalValue(vm, "citation-title");
	arguments.citationYear = optionalValue(vm, "citation-year");
	arguments.timestamp = optionalValue(vm, "timestamp");

	ExperimentMetadata metadata = ExperimentMetadata::load(metadataPaths);

	// Configure the operation
	GDALAllRegister();
	Process process(inputPaths, workingSpace, arguments, metadata, variant, &logger);
	process.progress = [&reporter](float complete, const std::string& message)
	{
		reporter->report(complete, message);
		return true;
	};

	process.execute();
	reporter.reset();
	if (!vm.count("quiet"))
		std::cerr << std::endl;

	// Summary
	const ProcessResult& result = process.target();
	std::string document = result.toJson().dump(4);
	std::cout << document << std::endl;

	fs::path resultPath = fs::path(workingSpace) / "result.json";
	std::ofstream resultFile(resultPath.string());
	resultFile << document << std::endl;
	if (!resultFile)
	{
		std::cerr << "ERROR: Unable to write '" << resultPath.string() << "'." << std::endl;
		return UnexpectedError;
	}

	return result.code < 0 ? NoResult : Success;
}
catch (po::error& ex)
{
	std::cerr << "ERROR: " << ex.what() << std::endl;
	std::cerr << "Use the --help option for description." << std::endl;
	return InvalidInput;
}
catch (ImageNotFound& ex)
{
	std::cerr << "ERROR: " << ex.what() << std::endl;
	return InvalidInput;
}
catch (std::invalid_argument& ex)
{
	std::cerr << "ERROR: " << ex.what() << std::endl;
	return InvalidInput;
}
catch (std::exception& ex)
{
	std::cerr << "ERROR: " << ex.what() << std::endl;
	return UnexpectedError;
}
