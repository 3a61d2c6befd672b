/**
 * @file strata_cli.cpp
 * @brief CLI to create, inspect and exercise fabric snapshots
 *
 * Usage:
 *   strata_cli create <out.json> [--dimension D] [--init-std S] [--seed N] [--identity-noise]
 *   strata_cli info <snapshot>
 *   strata_cli query <snapshot> <scale> <id> <target_scale> [k]
 *   strata_cli propagate <snapshot> <scale> <id> <target_scale> [strength]
 *   strata_cli learn <snapshot> <scale> <id> <rate> <v1,v2,...>
 */

#include <fabric.hpp>
#include <persistence/persistence_manager.hpp>
#include <integration/collaborators.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

using namespace Strata;

static void usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " create <out.json> [--dimension D] [--init-std S] [--seed N] [--identity-noise]\n"
              << "  " << prog << " info <snapshot>\n"
              << "  " << prog << " query <snapshot> <scale> <id> <target_scale> [k]\n"
              << "  " << prog << " propagate <snapshot> <scale> <id> <target_scale> [strength]\n"
              << "  " << prog << " learn <snapshot> <scale> <id> <rate> <v1,v2,...>\n";
}

static std::unique_ptr<Fabric> open_snapshot(const std::string& path) {
    LoadOptions options;
    options.expected_schema.reset();
    return Fabric::load(std::filesystem::path(path), options);
}

static std::string component_name(const Fabric& fabric, const std::string& scale, size_t id) {
    Metadata m = fabric.get_metadata(scale, id);
    auto it = m.find(MetaKeys::NAME);
    if (it != m.end() && it->is_string()) return it->get<std::string>();
    return "-";
}

static Vector parse_values(const std::string& csv) {
    std::vector<double> values;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t used = 0;
        double v = std::stod(item, &used);
        if (used != item.size()) {
            throw ArgumentError("Not a number: '" + item + "'");
        }
        values.push_back(v);
    }
    return Eigen::Map<const Vector>(values.data(), static_cast<Eigen::Index>(values.size()));
}

// =============================================================================
//  Commands
// =============================================================================

static int cmd_create(int argc, char** argv) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    FabricConfig config = FabricConfig::from_env();
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--identity-noise") {
            config.transform_init = TransformInit::IdentityNoise;
        } else if (i + 1 < argc && arg == "--dimension") {
            config.dimension = std::stoul(argv[++i]);
        } else if (i + 1 < argc && arg == "--init-std") {
            config.init_std = std::stod(argv[++i]);
        } else if (i + 1 < argc && arg == "--seed") {
            config.seed = std::stoull(argv[++i]);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            usage(argv[0]);
            return 1;
        }
    }

    auto fabric = create_integrated_fabric(std::move(config));
    fabric->save(std::filesystem::path(argv[2]));
    std::cout << "Seed: " << *fabric->config().seed << "\n";
    return 0;
}

static int cmd_info(int argc, char** argv) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    auto fabric = open_snapshot(argv[2]);
    FabricState st = fabric->state();

    std::cout << "Dimension:     " << st.dimension << "\n";
    std::cout << "Transforms:    " << st.transforms << "\n";
    std::cout << "Scales:\n";
    for (const auto& s : st.scales) {
        std::cout << "  " << std::setw(12) << std::left << s.name
                  << " components=" << std::setw(6) << s.components
                  << " norm mean=" << std::fixed << std::setprecision(6) << s.norm_mean
                  << " std=" << s.norm_std << "\n";
    }
    std::cout << "Collaborators:";
    for (const auto& c : st.collaborators) std::cout << " " << c;
    std::cout << "\n";
    return 0;
}

static int cmd_query(int argc, char** argv) {
    if (argc < 6) {
        usage(argv[0]);
        return 1;
    }

    auto fabric = open_snapshot(argv[2]);
    std::string scale = argv[3];
    size_t id = std::stoul(argv[4]);
    std::string target = argv[5];
    size_t k = (argc > 6) ? std::stoul(argv[6]) : 5;

    Vector probe = fabric->transform_across_scales(fabric->get_embedding(scale, id), scale, target);
    auto hits = fabric->query_similar(probe, target, k);

    std::cout << "Top " << hits.size() << " " << target << " components for "
              << scale << "[" << id << "]:\n";
    for (const auto& hit : hits) {
        std::cout << "  " << std::setw(6) << std::right << hit.id << "  "
                  << std::fixed << std::setprecision(6) << std::setw(10) << hit.score << "  "
                  << component_name(*fabric, target, hit.id) << "\n";
    }
    return 0;
}

static int cmd_propagate(int argc, char** argv) {
    if (argc < 6) {
        usage(argv[0]);
        return 1;
    }

    auto fabric = open_snapshot(argv[2]);
    std::string scale = argv[3];
    size_t id = std::stoul(argv[4]);
    std::string target = argv[5];
    double strength = (argc > 6) ? std::stod(argv[6]) : 1.0;

    ActivationMap activations = fabric->propagate_signal(scale, id, target, strength);

    std::vector<std::pair<size_t, double>> ranked(activations.begin(), activations.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::cout << "Activations in " << target << " from " << scale << "[" << id << "]:\n";
    for (const auto& [target_id, activation] : ranked) {
        if (activation <= 0.0) break;
        std::cout << "  " << std::setw(6) << std::right << target_id << "  "
                  << std::fixed << std::setprecision(6) << std::setw(10) << activation << "  "
                  << component_name(*fabric, target, target_id) << "\n";
    }
    return 0;
}

static int cmd_learn(int argc, char** argv) {
    if (argc < 7) {
        usage(argv[0]);
        return 1;
    }

    std::filesystem::path path(argv[2]);
    auto fabric = open_snapshot(argv[2]);
    std::string scale = argv[3];
    size_t id = std::stoul(argv[4]);
    double rate = std::stod(argv[5]);
    Vector observation = parse_values(argv[6]);

    Vector before = fabric->get_embedding(scale, id);
    fabric->update_from_observation(scale, id, observation, rate);
    Vector after = fabric->get_embedding(scale, id);
    fabric->save(path);

    std::cout << "Distance to observation: " << std::fixed << std::setprecision(6)
              << (observation - before).norm() << " -> " << (observation - after).norm() << "\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    try {
        if (command == "create")    return cmd_create(argc, argv);
        if (command == "info")      return cmd_info(argc, argv);
        if (command == "query")     return cmd_query(argc, argv);
        if (command == "propagate") return cmd_propagate(argc, argv);
        if (command == "learn")     return cmd_learn(argc, argv);

        std::cerr << "Unknown command: " << command << "\n";
        usage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}
