#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "mirror_engine.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->load_from_environment();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "ftp_mirror");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      print_err("{}", e.what());
      parser.usage(true);
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }
    if(settings->get<std::string>("watch_folder").empty()) {
      parser.usage(true);
      return 1;
    }

    MirrorEngine::Options options;
    options.working_dir = std::filesystem::current_path();
    MirrorEngine engine(settings, options);
    try {
      engine.start();
    } catch(const StartupError& e) {
      log_error(engine.logger().get(), "Failed to start FTP file watcher: {}", e.what());
      return 1;
    }
    engine.run();
    engine.stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("ftp-mirror-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
