/**
 * vigil-cli: Run head-pose attention analysis on an image; print the JSON response.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/vigil-cli/vigil_cli [--config path] [--mode analyze|attention|people] [--input path]
 * With --input: also writes the response to output/<basename>.json (same content as terminal).
 */

#include <vigil/app/analysis_runner.hpp>
#include <vigil/app/config.hpp>
#include <vigil/app/factory.hpp>
#include <vigil/app/log.hpp>
#include <vigil/app/response_json.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/frame.hpp>
#include <vigil/vision/load_image.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace vlog = vigil::app::log;

vigil::core::Frame make_dummy_frame(std::uint32_t w, std::uint32_t h) {
  const std::size_t bytes = static_cast<std::size_t>(w) * h * 3;
  std::vector<std::byte> buffer(bytes, std::byte{0});
  return vigil::core::Frame(w, h, vigil::core::PixelFormat::RGB8, std::move(buffer));
}

void print_usage() {
  std::cout << "Usage: vigil_cli [options] [--input <path>]\n"
            << "  --config <path>   Analyzer config (key=value file); default: built-in (mock)\n"
            << "  --backend <type>  Override backend: mock | onnx (default from config)\n"
            << "  --mode <mode>     analyze | attention | people (default: analyze)\n"
            << "  --input <path>    Image path (optional with mock; demo uses a synthetic frame)\n"
            << "\nModel files for onnx: face_model_path=, landmark_model_path=, model_points_path=,\n"
            << "people_model_path= (people mode) in the config file.\n";
}

int fail(const std::string& what) {
  vlog::err << what << vlog::endl;
  return 1;
}

nlohmann::json run_mode(const std::string& mode,
                        const vigil::app::AnalyzerConfig& cfg,
                        const vigil::core::Frame& frame,
                        vigil::core::AnalysisError& error) {
  if (mode == "people") {
    auto counter = vigil::app::make_people_counter(cfg);
    auto count = counter->count(frame);
    if (!count) {
      error = count.error();
      return {};
    }
    return vigil::app::to_json(*count);
  }

  const auto collaborators = vigil::app::make_collaborators(cfg);
  const auto pipeline = vigil::app::make_pipeline(cfg, collaborators);

  vigil::app::StepTimingCallback timing = [](vigil::core::PipelineStep step, double ms) {
    vlog::debug << "step " << static_cast<int>(step) << " took " << ms << " ms" << vlog::endl;
  };

  if (mode == "attention") {
    auto report = vigil::app::run_attention(pipeline, frame, 0, std::nullopt, &timing);
    if (!report) {
      error = report.error();
      return {};
    }
    return vigil::app::to_json(*report);
  }

  auto result = vigil::app::run_analysis(pipeline, frame, 0, std::nullopt, &timing);
  if (!result) {
    error = result.error();
    return {};
  }
  return vigil::app::to_json(*result);
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string backend_override;  // "mock" or "onnx"
  std::string mode = "analyze";

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--mode" && i + 1 < argc) {
      mode = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
  }

  if (mode != "analyze" && mode != "attention" && mode != "people") {
    return fail("Unknown --mode " + mode + " (use analyze, attention, or people)");
  }

  vigil::app::AnalyzerConfig cfg;
  try {
    cfg = config_path.empty() ? vigil::app::default_config()
                              : vigil::app::load_config(config_path);
  } catch (const std::exception& e) {
    return fail("Failed to read config " + config_path + ": " + e.what());
  }
  vlog::set_level(cfg.log_level);

  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend_type = vigil::app::InferenceBackendType::Mock;
    } else if (backend_override == "onnx") {
      cfg.backend_type = vigil::app::InferenceBackendType::Onnx;
    } else {
      return fail("Unknown --backend " + backend_override + " (use mock or onnx)");
    }
  }

  vigil::core::Frame frame;
  if (!input_path.empty()) {
    auto loaded = vigil::vision::load_frame_from_image(input_path);
    if (!loaded) {
      return fail("Failed to load image: " + input_path);
    }
    frame = std::move(*loaded);
  } else if (cfg.backend_type == vigil::app::InferenceBackendType::Onnx) {
    return fail("--input is required with the onnx backend");
  } else {
    frame = make_dummy_frame(320, 240);
  }

  nlohmann::json response;
  auto error = vigil::core::AnalysisError::None;
  try {
    response = run_mode(mode, cfg, frame, error);
  } catch (const std::exception& e) {
    return fail(std::string("Setup failed: ") + e.what());
  }
  if (error != vigil::core::AnalysisError::None) {
    return fail("Analysis failed: " + std::string(vigil::core::to_string(error)));
  }

  const std::string text = response.dump(2) + "\n";
  std::cout << text;

  if (!input_path.empty()) {
    std::filesystem::path p(input_path);
    std::filesystem::path out_dir("output");
    std::filesystem::create_directories(out_dir);
    std::filesystem::path out_file = out_dir / (p.stem().string() + ".json");
    std::ofstream f(out_file);
    if (f) {
      f << text;
    } else {
      vlog::warn << "could not write " << out_file.string() << vlog::endl;
    }
  }
  return 0;
}
