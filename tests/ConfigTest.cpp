// =================================================================
// tests/ConfigTest.cpp
// =================================================================
// Unit tests for YAML configuration loading and settings layering.

#include "Folio/AggregatorConfig.hpp"
#include "Folio/Commands.hpp"
#include "Folio/ConfigParser.hpp"
#include "Folio/Core.hpp"
#include "Folio/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <cassert>

namespace fs = std::filesystem;

namespace {
const char* SAMPLE_CONFIG =
    "title: My Docs\n"
    "follow_symlinks: yes\n"
    "extensions: [py, .RS]\n"
    "ignore_dirs: vendor\n"
    "ignore_files:\n"
    "  - secrets.py\n"
    "ignore_patterns:\n"
    "  - '*.gen.py'\n"
    "  - '!keep.gen.py'\n"
    "nested:\n"
    "  key: value\n";
}

class ConfigTest {
private:
    fs::path test_dir;

    void writeFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
    }

    void cleanupTestFiles() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

public:
    ConfigTest() : test_dir(fs::temp_directory_path() / "folio_config_test") {}

    void testParserFromString() {
        std::cout << "Testing YAML parsing from text..." << std::endl;

        Folio::ConfigParser parser = Folio::ConfigParser::fromString(SAMPLE_CONFIG);
        assert(parser.isLoaded());

        assert(parser.getStringValue("title") == "My Docs");
        assert(parser.getStringValue("nested.key") == "value" && "Dotted keys walk nested maps");
        assert(parser.getStringValue("nested").empty() && "Maps are not scalars");
        assert(parser.getStringValue("missing").empty());
        assert(parser.hasKey("nested.key"));
        assert(!parser.hasKey("nested.missing"));
        assert(!parser.hasKey("title.deeper"));

        std::vector<std::string> extensions = parser.getStringList("extensions");
        assert(extensions.size() == 2);
        assert(extensions[0] == "py" && extensions[1] == ".RS");

        std::vector<std::string> dirs = parser.getStringList("ignore_dirs");
        assert(dirs.size() == 1 && dirs[0] == "vendor" && "A scalar reads as a one-element list");
        assert(parser.getStringList("nested").empty());

        assert(parser.getBoolValue("follow_symlinks", false));
        assert(parser.getBoolValue("title", true) && "Non-boolean values fall back to the default");
        assert(!parser.getBoolValue("missing", false));

        std::cout << "✓ YAML parsing from text test passed" << std::endl;
    }

    void testRejectedDocuments() {
        std::cout << "Testing rejected YAML documents..." << std::endl;

        assert(!Folio::ConfigParser::fromString("- a\n- b\n").isLoaded() && "The root must be a mapping");
        assert(!Folio::ConfigParser::fromString("title: [unclosed\n").isLoaded());
        assert(Folio::ConfigParser::fromString("title: [unclosed\n").getStringValue("title").empty());

        std::cout << "✓ Rejected YAML documents test passed" << std::endl;
    }

    void testParserFromFile() {
        std::cout << "Testing YAML parsing from files..." << std::endl;

        cleanupTestFiles();
        writeFile(test_dir / "good.yml", SAMPLE_CONFIG);
        writeFile(test_dir / "bad.yml", "title: \"unterminated\n  : :\n");
        writeFile(test_dir / "list.yml", "- py\n- rs\n");

        Folio::ConfigParser good((test_dir / "good.yml").string());
        assert(good.isLoaded());
        assert(good.getPath() == (test_dir / "good.yml").string());
        assert(good.getStringValue("title") == "My Docs");

        Folio::ConfigParser missing((test_dir / "missing.yml").string());
        assert(!missing.isLoaded() && "A missing file is not an error");
        assert(missing.getStringList("extensions").empty());

        Folio::ConfigParser bad((test_dir / "bad.yml").string());
        assert(!bad.isLoaded() && "Malformed files are ignored");

        Folio::ConfigParser list((test_dir / "list.yml").string());
        assert(!list.isLoaded());

        cleanupTestFiles();
        std::cout << "✓ YAML parsing from files test passed" << std::endl;
    }

    void testLayering() {
        std::cout << "Testing settings layering..." << std::endl;

        Folio::ConfigParser parser = Folio::ConfigParser::fromString(SAMPLE_CONFIG);

        Folio::AggregatorConfig config;
        config.loadFromConfig(parser);
        assert(config.title == "My Docs");
        assert(config.follow_symlinks);
        assert(config.extensions.size() == 2);
        assert(config.ignore_patterns.size() == 2);

        Folio::Commands commands;
        commands.input_dir = "project";
        commands.title = "From CLI";
        commands.ignore_dirs = {"third_party"};
        config.applyCommandOverrides(commands);

        assert(config.input_dir == "project");
        assert(config.title == "From CLI" && "Command line wins over the file");
        assert(config.extensions.size() == 2 && "Absent CLI extensions keep the file's");
        assert(config.follow_symlinks && "The CLI flag can only enable following");

        auto dirs = config.getMergedIgnoredDirs();
        assert(dirs.count("vendor") == 1);
        assert(dirs.count("third_party") == 1);
        assert(dirs.count("node_modules") == 1 && "Defaults stay in effect");

        auto files = config.getMergedIgnoredFiles();
        assert(files.count("secrets.py") == 1);
        assert(files.count(".DS_Store") == 1);

        commands.extensions = {"cpp"};
        config.applyCommandOverrides(commands);
        auto extensions = config.getMergedExtensions();
        assert(extensions.size() == 1 && extensions.count(".cpp") == 1);

        std::cout << "✓ Settings layering test passed" << std::endl;
    }

    void testDefaults() {
        std::cout << "Testing defaults..." << std::endl;

        Folio::AggregatorConfig config;
        auto extensions = config.getMergedExtensions();
        assert(extensions.size() == Folio::AggregatorConfig::getDefaultExtensions().size());
        assert(extensions.count(".py") == 1);
        assert(extensions.count(".cpp") == 1);
        assert(extensions.count(".md") == 0 && "Markdown is handled separately");

        auto dirs = Folio::AggregatorConfig::getDefaultIgnoredDirs();
        assert(std::find(dirs.begin(), dirs.end(), "__pycache__") != dirs.end());
        assert(std::find(dirs.begin(), dirs.end(), ".git") != dirs.end());

        config.extensions = {"PY", ".Rs"};
        extensions = config.getMergedExtensions();
        assert(extensions.count(".py") == 1 && extensions.count(".rs") == 1);

        assert(Folio::AggregatorConfig::getDefaultOutputFile("/work/project") == fs::path("/work/project.md"));
        assert(Folio::AggregatorConfig::getDefaultOutputFile("/").empty());

        assert(config.getEffectiveTitle("/work/project") == "project Source Archive");
        config.title = "Custom";
        assert(config.getEffectiveTitle("/work/project") == "Custom");

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testValidation() {
        std::cout << "Testing validation..." << std::endl;

        Folio::AggregatorConfig config;
        assert(!config.validate() && "An input directory is required");

        config.input_dir = "project";
        assert(config.validate());

        config.extensions = {"py", "."};
        assert(!config.validate() && "A bare dot is not an extension");

        config.extensions = {"py", ""};
        assert(!config.validate());

        config.extensions = {"py", ".h"};
        assert(config.validate());

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testCoreConfigDiscovery() {
        std::cout << "Testing configuration discovery..." << std::endl;

        cleanupTestFiles();
        fs::path project = test_dir / "project";
        writeFile(project / ".folio.yml", "title: From File\nextensions: [go]\n");
        writeFile(test_dir / "other.yml", "title: Other File\n");

        Folio::Commands commands;
        commands.input_dir = project.string();
        {
            Folio::Core core(commands);
            Folio::AggregatorConfig config = core.buildConfig();
            assert(config.title == "From File" && "The input directory's .folio.yml is picked up");
            assert(config.extensions.size() == 1 && config.extensions[0] == "go");
        }

        commands.title = "From CLI";
        {
            Folio::Core core(commands);
            assert(core.buildConfig().title == "From CLI");
        }

        commands.title.clear();
        commands.config_path = (test_dir / "other.yml").string();
        {
            Folio::Core core(commands);
            Folio::AggregatorConfig config = core.buildConfig();
            assert(config.title == "Other File" && "An explicit config replaces discovery");
            assert(config.extensions.empty());
        }

        cleanupTestFiles();
        std::cout << "✓ Configuration discovery test passed" << std::endl;
    }

    void testCoreLoggingOptions() {
        std::cout << "Testing logging options..." << std::endl;

        cleanupTestFiles();
        Folio::Logger& logger = Folio::Logger::getInstance();

        Folio::Commands commands;
        commands.input_dir = test_dir.string();
        commands.verbose = true;
        {
            Folio::Core core(commands);
            assert(logger.getConsoleLogLevel() == Folio::LogLevel::DEBUG);
        }

        commands.verbose = false;
        commands.quiet = true;
        commands.log_dir = (test_dir / "logs").string();
        {
            Folio::Core core(commands);
            assert(logger.getConsoleLogLevel() == Folio::LogLevel::ERROR);
            assert(logger.isFileLoggingEnabled());
        }
        logger.flush();

        bool found_log = false;
        for (const auto& entry : fs::directory_iterator(test_dir / "logs")) {
            std::string name = entry.path().filename().string();
            if (name.rfind("folio_", 0) == 0 && entry.path().extension() == ".log") {
                found_log = true;
            }
        }
        assert(found_log && "Log files are created in the requested directory");

        logger.setConsoleLogLevel(Folio::LogLevel::CRITICAL);
        cleanupTestFiles();
        std::cout << "✓ Logging options test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running configuration unit tests..." << std::endl;

        testParserFromString();
        testRejectedDocuments();
        testParserFromFile();
        testLayering();
        testDefaults();
        testValidation();
        testCoreConfigDiscovery();
        testCoreLoggingOptions();

        std::cout << "All configuration tests passed!" << std::endl;
    }
};

int main() {
    Folio::Logger::getInstance().setConsoleLogLevel(Folio::LogLevel::CRITICAL);

    try {
        ConfigTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
