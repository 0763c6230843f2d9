#include <iostream>
#include <string>

#include "chessplanes/ort_input.hpp"
#include "chessplanes/planes.hpp"

using namespace chessplanes;

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cout << "Usage: chessplanes_ort_probe <model.onnx> [--extended]\n";
    return 1;
  }
  const std::string path = argv[1];
  const bool extended = (argc >= 3 && std::string(argv[2]) == "--extended");
  const int channels = extended ? PlaneLayout::kExtendedChannels : PlaneLayout::kBasicChannels;

  std::string err;
  if (!ort_model_accepts(path, channels, &err)) {
    std::cerr << "ort_probe: " << err << "\n";
    return 1;
  }
  std::cout << "ok " << path << " accepts (" << channels << ",8,8) planes\n";
  return 0;
}
