#pragma once

#include <string>

#include <onnxruntime_cxx_api.h>

#include "chessplanes/planes.hpp"

namespace chessplanes {

// Wraps x as a float tensor of shape [1, C, 8, 8] sharing x's storage.
// x must outlive the returned value. Throws InvalidShape for tensors that
// are not (12|19, 8, 8).
Ort::Value make_ort_input(PlaneTensor& x, const Ort::MemoryInfo& mem);

// Opens the model and checks that it has a single float input of rank 4
// whose dimensions are [1 or dynamic, channels, 8, 8] (channel, rank and file
// dimensions may also be dynamic). Returns false and fills outErr otherwise.
bool ort_model_accepts(const std::string& path, int channels, std::string* outErr = nullptr);

} // namespace chessplanes
