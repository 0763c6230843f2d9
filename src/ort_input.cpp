// src/ort_input.cpp

#include "chessplanes/ort_input.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chessplanes {
namespace {

// Process-lifetime Env: tearing it down at exit trips ORT shutdown bugs on
// some platforms (microsoft/onnxruntime#24579).
static Ort::Env& ort_env() {
  static Ort::Env* env = new Ort::Env(ORT_LOGGING_LEVEL_WARNING, "chessplanes");
  return *env;
}

static void set_err(std::string* outErr, const std::string& msg) {
  if (outErr) *outErr = msg;
}

static bool dim_matches(int64_t got, int64_t want) {
  return got == -1 || got == want;
}

static std::string dims_string(const std::vector<int64_t>& shape) {
  std::string s = "[";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i) s += ",";
    s += std::to_string(shape[i]);
  }
  return s + "]";
}

} // namespace

Ort::Value make_ort_input(PlaneTensor& x, const Ort::MemoryInfo& mem) {
  require_valid_shape(x, "make_ort_input");
  const std::array<int64_t, 4> shape = {
    1,
    static_cast<int64_t>(x.channels()),
    static_cast<int64_t>(x.ranks()),
    static_cast<int64_t>(x.files()),
  };
  return Ort::Value::CreateTensor<float>(mem, x.data(), x.size(), shape.data(), shape.size());
}

bool ort_model_accepts(const std::string& path, int channels, std::string* outErr) {
  if (channels != PlaneLayout::kBasicChannels && channels != PlaneLayout::kExtendedChannels) {
    set_err(outErr, "channel count must be 12 or 19, got " + std::to_string(channels));
    return false;
  }

  try {
    Ort::SessionOptions opt;
    opt.SetIntraOpNumThreads(1);
    opt.SetInterOpNumThreads(1);
    opt.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_BASIC);

    Ort::Session session(ort_env(), path.c_str(), opt);

    if (session.GetInputCount() != 1) {
      set_err(outErr, "model must have exactly one input, has " + std::to_string(session.GetInputCount()));
      return false;
    }

    Ort::TypeInfo inTi = session.GetInputTypeInfo(0);
    auto inTsi = inTi.GetTensorTypeAndShapeInfo();
    if (inTsi.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
      set_err(outErr, "model input is not a float tensor");
      return false;
    }

    const std::vector<int64_t> shape = inTsi.GetShape();
    const bool ok = shape.size() == 4 &&
                    (shape[0] == -1 || shape[0] == 1) &&
                    dim_matches(shape[1], channels) &&
                    dim_matches(shape[2], PlaneLayout::kRanks) &&
                    dim_matches(shape[3], PlaneLayout::kFiles);
    if (!ok) {
      set_err(outErr, "model input shape " + dims_string(shape) + " does not accept (" +
                      std::to_string(channels) + ",8,8) planes");
      return false;
    }
    return true;
  } catch (const Ort::Exception& e) {
    set_err(outErr, std::string("onnxruntime: ") + e.what());
    return false;
  }
}

} // namespace chessplanes
