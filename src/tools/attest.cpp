#include <boost/program_options.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <verity/attestation/signer.hpp>
#include <verity/blake3/hash.hpp>
#include <verity/matching/name_matcher.hpp>
#include <verity/storage/rocksdb/storage.hpp>
#include <verity/storage/secure_store.hpp>
#include <verity/verification/aggregator.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace po = boost::program_options;

constexpr auto kMachineIdPath = "/etc/machine-id";

void configure_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "attest", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

// Stable per-host identifier: a BLAKE3 handle of the machine id, never the
// machine id itself.
std::optional<std::string> machine_device_id(std::string& error) {
  auto input = std::ifstream{kMachineIdPath};
  if (!input.is_open()) {
    error = std::string{"cannot open "} + kMachineIdPath;
    return std::nullopt;
  }
  auto machine_id = std::string{};
  std::getline(input, machine_id);
  if (machine_id.empty()) {
    error = std::string{kMachineIdPath} + " is empty";
    return std::nullopt;
  }
  return "dev_" + verity::blake3::fingerprint(machine_id);
}

void print_help(const po::options_description& options) {
  std::cout << "verity-attest: match a document against a profile name and "
               "sign the outcome\n\n"
            << options << std::endl;
}

}  // namespace

int main(int argc, const char** argv) {
  auto document_given = std::string{};
  auto document_family = std::string{};
  auto profile_name = std::string{};
  auto document_type = std::string{};
  auto issuing_country = std::string{};
  auto store_path = std::string{};
  auto app_version = std::string{};
  auto log_file = std::string{};

  auto options = po::options_description{"verity-attest options"};
  options.add_options()("help,h", "show help")(
      "document-given", po::value<std::string>(&document_given)->required(),
      "given name as printed on the document")(
      "document-family", po::value<std::string>(&document_family)->required(),
      "family name as printed on the document")(
      "profile-name", po::value<std::string>(&profile_name)->required(),
      "profile display name")(
      "document-type",
      po::value<std::string>(&document_type)->default_value("passport"),
      "document type code")(
      "issuing-country",
      po::value<std::string>(&issuing_country)->default_value(""),
      "issuing country code")("face-score", po::value<double>(),
                              "biometric face similarity in [0, 1]")(
      "document-face", po::value<bool>()->default_value(true),
      "face detected in the document photo")(
      "profile-face", po::value<bool>()->default_value(true),
      "face detected in the profile photo")(
      "selfie-face", po::value<bool>()->default_value(true),
      "face detected in the selfie")(
      "liveness-required", po::value<std::vector<std::string>>()->multitoken(),
      "required liveness challenges")(
      "liveness-completed", po::value<std::vector<std::string>>()->multitoken(),
      "completed liveness challenges")(
      "liveness-duration-ms", po::value<uint64_t>()->default_value(0),
      "liveness session duration")(
      "store-path",
      po::value<std::string>(&store_path)->default_value("verity_store"),
      "RocksDB directory holding the device key")(
      "app-version", po::value<std::string>(&app_version)->default_value("0.0.0"),
      "application version stamped on the attestation")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "also write logs to this file")("verbose,v", "enable debug logging");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);
    if (vm.contains("help")) {
      print_help(options);
      return 0;
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n\n";
    print_help(options);
    return 2;
  }

  configure_logging(log_file, vm.contains("verbose"));

  auto name_match = verity::matching::match_names(
      document_given, document_family, profile_name);

  auto face_match = std::optional<verity::schema::face_match_result_t>{};
  if (vm.contains("face-score")) {
    face_match = verity::verification::make_face_match_result(
        vm["face-score"].as<double>(), vm["document-face"].as<bool>(),
        vm["profile-face"].as<bool>(), vm["selfie-face"].as<bool>());
  }

  auto liveness = std::optional<verity::schema::liveness_result_t>{};
  if (vm.contains("liveness-required")) {
    auto completed = std::vector<std::string>{};
    if (vm.contains("liveness-completed")) {
      completed = vm["liveness-completed"].as<std::vector<std::string>>();
    }
    liveness = verity::verification::make_liveness_result(
        vm["liveness-required"].as<std::vector<std::string>>(),
        std::move(completed), vm["liveness-duration-ms"].as<uint64_t>());
  }

  auto result = verity::verification::create_verification_result(
      std::move(name_match), document_type, issuing_country,
      std::move(face_match), std::move(liveness));

  std::cout << "level: "
            << verity::schema::to_string(
                   verity::verification::get_verification_level(result))
            << "\n";
  std::cout << "passed: " << std::boolalpha
            << verity::verification::is_verification_passed(result) << "\n";
  std::cout << "name score: " << result.name_match.score << "\n";
  for (const auto& reason :
       verity::verification::get_verification_failure_reasons(result)) {
    std::cout << "reason: " << reason << "\n";
  }

  auto error = std::string{};
  auto backend =
      verity::storage::try_make_storage<verity::storage::rocksdb_storage_tag>(
          store_path, error);
  if (!backend) {
    spdlog::error("no attestation produced: {}", error);
    spdlog::shutdown();
    return 1;
  }
  auto signer = verity::attestation::signer{
      verity::storage::make_secure_store(*backend), machine_device_id,
      verity::attestation::signer_options{.app_version = app_version}};

  auto attestation = signer.create_signed_verification(result, error);
  if (!attestation) {
    spdlog::error("no attestation produced: {}", error);
    spdlog::shutdown();
    return 1;
  }

  std::cout << "payload: " << attestation->payload << "\n";
  std::cout << "signature: " << attestation->signature << "\n";
  std::cout << "device_id: " << attestation->device_id << "\n";
  std::cout << "app_version: " << attestation->app_version << std::endl;

  spdlog::shutdown();
  return 0;
}
