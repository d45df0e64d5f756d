#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <resonance/crypto/key_material.hpp>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  auto out = std::string{};

  namespace po = boost::program_options;
  auto vm = po::variables_map{};
  auto description = po::options_description{"Resonance key generator"};
  description.add_options()("help,h", "Show the help message")(
      "out,o", po::value<std::string>(&out), "Key file to write")(
      "force,f", "Replace an existing key file");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help") || out.empty()) {
    std::cout << description << std::endl;
    return out.empty() && !vm.contains("help") ? 1 : 0;
  }

  auto error = std::string{};
  auto keys = resonance::crypto::key_material::generate(error);
  if (!keys) {
    spdlog::error("Key generation failed: {}", error);
    return 1;
  }
  if (!keys->save(out, vm.contains("force"), error)) {
    spdlog::error("Cannot write {}: {}", out, error);
    return 1;
  }
  spdlog::info("Wrote key material to {}", out);
  return 0;
}
