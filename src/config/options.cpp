#include <boost/program_options.hpp>
#include <veil/common/logging.hpp>
#include <veil/config/options.hpp>

#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace veil::config {

std::optional<ledger_options> parse_options(const int argc,
                                            const char* const argv[],
                                            std::string& error) {
  auto options = ledger_options{};
  auto config_path = std::string{};
  auto mode_name = std::string{};
  auto level_name = std::string{};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style file holding any of the ledger options");

  auto ledger = po::options_description{"Ledger"};
  ledger.add_options()(
      "db-path,d",
      po::value<std::string>(&options.db_path)->default_value(options.db_path),
      "RocksDB directory")(
      "aggregation-mode,m",
      po::value<std::string>(&mode_name)->default_value("count"),
      "Bucket aggregation: count or sum")(
      "key-file,k",
      po::value<std::string>(&options.key_file)
          ->default_value(options.key_file),
      "Local engine key file")(
      "log-level,l", po::value<std::string>(&level_name)->default_value("info"),
      "trace, debug, info, warn, err, critical or off")(
      "log-file", po::value<std::string>(&options.log_file),
      "Also write logs to this file");

  auto all = po::options_description{"veild"};
  all.add(generic).add(ledger);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, all), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto input = std::ifstream{path};
      if (!input) {
        error = "cannot open config file '" + path + "'";
        return std::nullopt;
      }
      po::store(po::parse_config_file(input, ledger), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    error = e.what();
    return std::nullopt;
  }

  if (vm.contains("help")) {
    options.show_help = true;
    auto text = std::ostringstream{};
    text << all;
    options.help_text = text.str();
    return options;
  }

  auto mode = veil::schema::try_from_string<veil::schema::aggregation_mode_t>(
      mode_name);
  if (!mode) {
    error = "unknown aggregation mode '" + mode_name + "'";
    return std::nullopt;
  }
  options.aggregation_mode = *mode;

  auto level = veil::common::try_parse_log_level(level_name);
  if (!level) {
    error = "unknown log level '" + level_name + "'";
    return std::nullopt;
  }
  options.log_level = *level;

  if (options.db_path.empty()) {
    error = "db-path must not be empty";
    return std::nullopt;
  }
  return options;
}

}  // namespace veil::config
