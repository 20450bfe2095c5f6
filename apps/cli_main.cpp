#include "raw_view/config/configuration.hpp"
#include "raw_view/core/errors.hpp"
#include "raw_view/core/events.hpp"
#include "raw_view/core/types.hpp"
#include "raw_view/core/utils.hpp"
#include "raw_view/image/decoded.hpp"
#include "raw_view/image/reconstruction.hpp"
#include "raw_view/session/image_list.hpp"
#include "raw_view/session/load_session.hpp"
#include "raw_view/session/viewer_state.hpp"
#include "raw_view/synthetic/synthetic.hpp"
#include "raw_view/view/view_transform.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace raw_view;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::vector<float> parse_floats(const std::string& s) {
    std::vector<float> out;
    for (const auto& part : core::split(s, ',')) {
        if (!part.empty()) {
            out.push_back(std::stof(part));
        }
    }
    return out;
}

static config::Config load_config_or_default(const std::string& path) {
    config::Config cfg;
    if (!path.empty()) {
        cfg = config::Config::load(path);
    }
    cfg.validate();
    return cfg;
}

static image::ReconstructOptions reconstruct_options(const config::Config& cfg) {
    image::ReconstructOptions opts;
    opts.parallel_workers = cfg.demosaic.parallel_workers;
    return opts;
}

static view::ViewSettings view_settings(const config::Config& cfg) {
    view::ViewSettings s;
    s.zoom_sensitivity = cfg.view.zoom_sensitivity;
    s.zoom_min = cfg.view.zoom_min;
    return s;
}

static void apply_calibration(SensorFrame& frame, const std::string& black,
                              const std::string& white, const std::string& wb) {
    auto fill4 = [](const std::vector<float>& v, std::array<float, 4>& out, const char* name) {
        if (v.empty()) return;
        if (v.size() != 3 && v.size() != 4) {
            throw ValidationError(std::string(name) + " expects 3 or 4 comma-separated values");
        }
        for (size_t i = 0; i < 4; ++i) {
            out[i] = v[std::min(i, v.size() - 1)];
        }
    };
    fill4(parse_floats(black), frame.black_levels, "--black");
    fill4(parse_floats(white), frame.white_levels, "--white");

    const auto gains = parse_floats(wb);
    if (!gains.empty()) {
        if (gains.size() != 3) {
            throw ValidationError("--wb expects 3 comma-separated values");
        }
        frame.wb_coeffs = {gains[0], gains[1], gains[2]};
    }
}

// Runs one frame through the load session the way the viewer does, then
// writes the installed image.
static int run_load(const config::Config& cfg, SensorFrame frame, const std::string& source,
                    const std::string& out_path) {
    core::EventEmitter events(std::cout, cfg.events.enabled);
    session::ViewerState viewer(view_settings(cfg));
    std::string failure;
    {
        session::LoadSession loader(viewer, events, reconstruct_options(cfg));
        loader.on_failure([&failure](session::LoadToken, const std::string& msg) {
            failure = msg;
        });
        auto token = loader.begin_load(source);
        loader.submit(token, std::move(frame));
        loader.wait_idle();
    }

    if (!failure.empty() || !viewer.has_image()) {
        std::cerr << "Error: " << (failure.empty() ? "no image produced" : failure) << std::endl;
        return 1;
    }

    auto loaded = viewer.current();
    std::cout << "[RECONSTRUCT] " << loaded->image->width << "x" << loaded->image->height
              << " in " << loaded->load_time.count() << " ms (~" << loaded->memory_mib
              << " MiB)" << std::endl;

    if (!out_path.empty()) {
        if (!cv::imwrite(out_path, image::to_bgr_mat(*loaded->image))) {
            std::cerr << "Error: cannot write " << out_path << std::endl;
            return 1;
        }
        std::cout << "Output: " << out_path << std::endl;
    }
    return 0;
}

// ============================================================================
// reconstruct <mosaic> --pattern P [--black ..] [--white ..] [--wb ..] [--out F]
// ============================================================================
int cmd_reconstruct(const std::string& input, const std::string& pattern_str,
                    const std::string& black, const std::string& white, const std::string& wb,
                    const std::string& out_path, const std::string& config_path) {
    const config::Config cfg = load_config_or_default(config_path);

    cv::Mat mosaic = cv::imread(input, cv::IMREAD_UNCHANGED);
    if (mosaic.empty()) {
        std::cerr << "Error: cannot decode mosaic: " << input << std::endl;
        return 1;
    }

    SensorFrame frame = image::sensor_frame_from_mosaic(mosaic, string_to_bayer_pattern(pattern_str));
    apply_calibration(frame, black, white, wb);
    return run_load(cfg, std::move(frame), input, out_path);
}

// ============================================================================
// synthetic --kind flat|patch|ramp [--width W] [--height H] [--pattern P] [--out F]
// ============================================================================
int cmd_synthetic(const std::string& kind, int width, int height, const std::string& pattern_str,
                  const std::string& out_path, const std::string& config_path) {
    const config::Config cfg = load_config_or_default(config_path);
    const BayerPattern pattern = string_to_bayer_pattern(pattern_str);
    const float white = 4095.0f;

    SensorFrame frame;
    if (kind == "flat") {
        frame = synthetic::flat_field(width, height, pattern, 1024, white);
    } else if (kind == "patch") {
        frame = synthetic::color_patch(width, height, pattern, 3000, 1500, 600, white);
    } else if (kind == "ramp") {
        frame = synthetic::ramp(width, height, pattern, white);
    } else {
        std::cerr << "Error: unknown --kind " << kind << " (flat, patch, ramp)" << std::endl;
        return 1;
    }
    return run_load(cfg, std::move(frame), "synthetic:" + kind, out_path);
}

// ============================================================================
// view --aspect A [--viewport WxH] [--zoom D] [--cursor X,Y] [--drag DX,DY]
// ============================================================================
int cmd_view(float aspect, const std::string& viewport, float zoom_delta,
             const std::string& cursor, const std::string& drag, const std::string& config_path) {
    const config::Config cfg = load_config_or_default(config_path);

    int vw = 1280, vh = 720;
    if (!viewport.empty()) {
        auto parts = core::split(viewport, 'x');
        if (parts.size() != 2) {
            std::cerr << "Error: --viewport expects WxH" << std::endl;
            return 1;
        }
        vw = std::stoi(parts[0]);
        vh = std::stoi(parts[1]);
    }

    view::ViewTransform vt(view_settings(cfg));
    vt.reset(aspect);

    if (zoom_delta != 0.0f) {
        Vector2f cursor_ndc = Vector2f::Zero();
        auto c = parse_floats(cursor);
        if (c.size() == 2) {
            cursor_ndc = view::screen_to_ndc(c[0], c[1], static_cast<float>(vw), static_cast<float>(vh));
        }
        vt.apply_zoom_delta(zoom_delta, cursor_ndc);
    }
    auto d = parse_floats(drag);
    if (d.size() == 2) {
        vt.apply_pan_delta(vt.screen_delta_to_pan(d[0], d[1], static_cast<float>(vw), static_cast<float>(vh)));
    }

    const ViewMatrices m = vt.derive_matrix(view::viewport_aspect(vw, vh));
    const view::UniformBlock block = view::pack_uniform(m);

    json result;
    result["zoom"] = vt.zoom();
    result["zoom_percent"] = vt.zoom_percent();
    result["pan"] = {vt.pan().x(), vt.pan().y()};
    result["scale"] = {m.scale.x(), m.scale.y()};
    result["uniform"] = std::vector<float>(block.begin(), block.end());
    print_json(result);
    return 0;
}

// ============================================================================
// list <image_path>
// ============================================================================
int cmd_list(const std::string& path, const std::string& config_path) {
    const config::Config cfg = load_config_or_default(config_path);
    session::ImageList list(cfg.navigation.extensions);

    json result;
    result["ok"] = list.update(path);
    result["entries"] = json::array();
    for (const auto& p : list.entries()) {
        result["entries"].push_back(p.string());
    }
    auto next = list.next();
    auto prev = list.previous();
    result["next"] = next ? json(next->string()) : json(nullptr);
    result["previous"] = prev ? json(prev->string()) : json(nullptr);
    print_json(result);
    return result["ok"].get<bool>() ? 0 : 1;
}

// ============================================================================
// validate-config (--path P | --yaml Y) [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        config::Config cfg = path.empty() ? config::Config::from_yaml(YAML::Load(yaml_arg))
                                          : config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// save-config <path>
// ============================================================================
int cmd_save_config(const std::string& path) {
    config::Config cfg;
    cfg.save(path);
    print_json({{"ok", true}, {"path", path}});
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: raw_view_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  reconstruct <mosaic> --pattern P [--black B] [--white W] [--wb R,G,B] [--out F]\n"
              << "                                  Demosaic a single-channel mosaic image\n"
              << "  synthetic --kind flat|patch|ramp [--width W] [--height H] [--pattern P] [--out F]\n"
              << "                                  Reconstruct a generated test mosaic\n"
              << "  view --aspect A [--viewport WxH] [--zoom D] [--cursor X,Y] [--drag DX,DY]\n"
              << "                                  Print the derived view transform\n"
              << "  list <image_path>               List neighbouring images for navigation\n"
              << "  validate-config (--path P | --yaml Y)  Validate config\n"
              << "  save-config <path>              Write the default config\n"
              << "\nAll commands accept --config <yaml>.\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    auto int_arg = [&](const char* name, int fallback) -> int {
        std::string v = get_arg(name);
        return v.empty() ? fallback : std::stoi(v);
    };

    const std::string config_path = get_arg("--config");

    try {
        if (command == "reconstruct") {
            std::string input = get_positional(0);
            if (input.empty()) {
                std::cerr << "reconstruct requires a mosaic path\n";
                return 1;
            }
            return cmd_reconstruct(input, get_arg("--pattern"), get_arg("--black"),
                                   get_arg("--white"), get_arg("--wb"), get_arg("--out"),
                                   config_path);
        }

        if (command == "synthetic") {
            std::string kind = get_arg("--kind");
            std::string pattern = get_arg("--pattern");
            return cmd_synthetic(kind.empty() ? "patch" : kind, int_arg("--width", 64),
                                 int_arg("--height", 48), pattern.empty() ? "RGGB" : pattern,
                                 get_arg("--out"), config_path);
        }

        if (command == "view") {
            std::string aspect = get_arg("--aspect");
            std::string zoom = get_arg("--zoom");
            return cmd_view(aspect.empty() ? 1.5f : std::stof(aspect), get_arg("--viewport"),
                            zoom.empty() ? 0.0f : std::stof(zoom), get_arg("--cursor"),
                            get_arg("--drag"), config_path);
        }

        if (command == "list") {
            std::string path = get_positional(0);
            if (path.empty()) {
                std::cerr << "list requires an image path\n";
                return 1;
            }
            return cmd_list(path, config_path);
        }

        if (command == "validate-config") {
            std::string path = get_arg("--path");
            std::string yaml = get_arg("--yaml");
            if (path.empty() && yaml.empty()) {
                std::cerr << "validate-config requires --path or --yaml\n";
                return 1;
            }
            return cmd_validate_config(path, yaml, has_flag("--strict-exit-codes"));
        }

        if (command == "save-config") {
            std::string path = get_positional(0);
            if (path.empty()) {
                std::cerr << "save-config requires a path argument\n";
                return 1;
            }
            return cmd_save_config(path);
        }
    } catch (const RawViewError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const cv::Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: malformed numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Error: numeric argument out of range (" << e.what() << ")" << std::endl;
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return 1;
}
