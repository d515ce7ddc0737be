#include "anchorfit/pipeline/Cli.hpp"
#include "anchorfit/anchor/AnchorOptimizer.hpp"
#include "anchorfit/common/Errors.hpp"
#include "anchorfit/common/Random.hpp"
#include "anchorfit/data/LabelDataset.hpp"
#include "anchorfit/model/DetectionModel.hpp"
#include "anchorfit/pipeline/AutoAnchor.hpp"
#include "anchorfit/pipeline/ToolConfig.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace anchorfit::pipeline {

namespace {

void printUsage(const char* program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n";
  out << "Options:\n";
  out << "  --cfg <path>         Configuration file (default: config/anchorfit.yaml)\n";
  out << "  --mode <m>           kmeans (derive anchors) or check (check/improve a model)\n";
  out << "  --data <path>        Dataset YAML\n";
  out << "  --model <path>       Model YAML with anchors (check mode)\n";
  out << "  --save <path>        Write updated model anchors here (check mode)\n";
  out << "  --n <N>              Number of anchors (default: 9)\n";
  out << "  --img <size>         Training image size (default: 640)\n";
  out << "  --thr <ratio>        Anchor/label ratio threshold (default: 4.0)\n";
  out << "  --gen <N>            Evolution generations (default: 1000)\n";
  out << "  --seed <N>           Seed for reproducible runs\n";
  out << "  --edge <c>           long_edge or axis_aligned\n";
  out << "  --verbose / --quiet  Report every improving generation or only the result\n";
  out << "  --log-level <lvl>    Set log level (TRACE/DEBUG/INFO/WARN/ERROR)\n";
  out << "  --help               Show this help message\n";
}

int runKmeans(const ToolConfig& cfg, common::Rng& rng, common::ILogger& logger, std::ostream& out) {
  if (cfg.data.empty()) {
    throw common::ConfigurationError("kmeans mode needs a dataset (--data)");
  }
  anchor::AnchorOptimizer optimizer(rng, logger);
  const anchor::AnchorList anchors = optimizer.optimize(cfg.data, toOptimizerConfig(cfg));
  for (const auto& a : anchors) {
    out << a.w << "," << a.h << "\n";
  }
  return 0;
}

int runCheck(const ToolConfig& cfg, common::Rng& rng, common::ILogger& logger, std::ostream& out) {
  if (cfg.data.empty() || cfg.model.empty()) {
    throw common::ConfigurationError("check mode needs --data and --model");
  }
  const data::LabelDataset dataset = data::LabelDataset::fromYaml(cfg.data, logger);
  model::AnchorModel model = model::loadAnchorsYaml(cfg.model);
  model::checkAnchorOrder(model.detectHead(), logger);

  anchor::AnchorOptimizer optimizer(rng, logger);
  const CheckResult result = checkAnchors(
      model, dataset, toAutoAnchorConfig(cfg), optimizer, rng, logger);
  AF_LOGI(logger, "Anchor check finished: ", toString(result.outcome));

  const anchor::AnchorSet pixels = model.detectHead().pixelAnchors();
  for (size_t l = 0; l < pixels.levels.size(); ++l) {
    out << "P" << l << "/" << model.detectHead().strides[l] << ":";
    for (const auto& a : pixels.levels[l]) {
      out << " " << a.w << "," << a.h;
    }
    out << "\n";
  }

  if (!cfg.save.empty() && result.outcome == CheckOutcome::Adopted) {
    model::saveAnchorsYaml(model, cfg.save);
    AF_LOGI(logger, "Saved anchors to ", cfg.save);
  }
  return 0;
}

}  // namespace

int runCli(int argc, const char* const* argv, common::StderrLogger& logger, std::ostream& out) {
  std::string cfg_path = "config/anchorfit.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-c" || a == "--cfg" || a == "--config") && i + 1 < argc) cfg_path = argv[++i];
    if (a == "--help" || a == "-h") {
      printUsage(argv[0], out);
      return 0;
    }
  }

  try {
    ToolConfig cfg = loadToolConfig(cfg_path, logger);

    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      auto next = [&]() -> std::string {
        if (i + 1 >= argc) throw common::ConfigurationError("missing value for " + a);
        return argv[++i];
      };
      if (a == "-c" || a == "--cfg" || a == "--config") { ++i; }
      else if (a == "--mode") cfg.mode = next();
      else if (a == "--data") cfg.data = next();
      else if (a == "--model") cfg.model = next();
      else if (a == "--save") cfg.save = next();
      else if (a == "--n") cfg.n = std::stoi(next());
      else if (a == "--img") cfg.img_size = std::stoi(next());
      else if (a == "--thr") cfg.thr = std::stof(next());
      else if (a == "--gen") cfg.gen = std::stoi(next());
      else if (a == "--seed") cfg.seed = static_cast<uint32_t>(std::stoul(next()));
      else if (a == "--edge") cfg.convention = data::parseEdgeConvention(next());
      else if (a == "--verbose") cfg.verbose = true;
      else if (a == "--quiet") cfg.verbose = false;
      else if (a == "--log-level") cfg.log_level = next();
      else {
        AF_LOGE(logger, "Unknown option: ", a);
        printUsage(argv[0], out);
        return 2;
      }
    }

    bool level_ok = true;
    logger.setLevel(common::parseLogLevel(cfg.log_level, &level_ok));
    if (!level_ok) {
      AF_LOGW(logger, "Unknown log level '", cfg.log_level, "', defaulting to INFO");
    }

    common::Rng rng = cfg.seed ? common::Rng(*cfg.seed) : common::Rng();
    if (cfg.mode == "kmeans") return runKmeans(cfg, rng, logger, out);
    if (cfg.mode == "check") return runCheck(cfg, rng, logger, out);
    throw common::ConfigurationError("unknown mode '" + cfg.mode + "' (expected kmeans or check)");
  } catch (const common::Error& e) {
    AF_LOGE(logger, e.what());
    return 1;
  } catch (const std::logic_error& e) {
    // std::stoi / std::stof on a malformed flag value
    AF_LOGE(logger, "Invalid argument: ", e.what());
    return 2;
  } catch (const std::exception& e) {
    AF_LOGE(logger, "Unexpected error: ", e.what());
    return 1;
  }
}

} // namespace anchorfit::pipeline
