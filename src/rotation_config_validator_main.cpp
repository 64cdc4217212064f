#include <iostream>
#include <turn-coordinator/RotationConfig.hpp>
using namespace turncoord;

int main(int argc, char *argv[]) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <rotation.yaml>\n";
    return 1;
  }
  auto result = RotationConfigLoader::validate(argv[1]);
  if (result.valid) {
    std::cout << "Validation succeeded.\n";
    return 0;
  } else {
    std::cout << "Validation failed:\n";
    for (const auto &err : result.errors) {
      std::cout << "  - " << err.path << ": " << err.message << "\n";
    }
    return 2;
  }
}
