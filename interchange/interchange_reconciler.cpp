#include "interchange_reconciler.hpp"

#include <common/errors.hpp>
#include <common/logging.hpp>

#include <cmath>
#include <limits>

namespace magnetmesh {

namespace {

constexpr const char* AIR_PREFIX = "Air_";
constexpr double TIE_TOLERANCE = 1e-12;

struct Candidate {
    DimTag tag;
    Vec3 centroid;
    BoundingBox box;
};

std::vector<Candidate> candidates(const Kernel& kernel, int dim) {
    std::vector<Candidate> result;
    for (const auto& tag : kernel.entities(dim)) {
        result.push_back({tag, kernel.center_of_mass(tag), kernel.bounding_box(tag)});
    }
    return result;
}

// Nearest entity within tolerance; equal distances keep the smallest tag
std::optional<DimTag> match(const std::vector<Candidate>& pool, const Locator& locator,
                            double tolerance) {
    std::optional<DimTag> best;
    double best_distance = std::numeric_limits<double>::max();
    for (const auto& c : pool) {
        double d = c.centroid.distance_to(locator.centroid);
        if (d > tolerance) continue;
        if (locator.bbox && c.box.distance_to(*locator.bbox) > tolerance) continue;
        bool closer = d < best_distance - TIE_TOLERANCE;
        bool tie = std::abs(d - best_distance) <= TIE_TOLERANCE && best && c.tag.tag < best->tag;
        if (!best || closer || tie) {
            best = c.tag;
            best_distance = d;
        }
    }
    return best;
}

Category category_for(const std::string& name, int dim, int top_dim, bool channel) {
    if (channel) return Category::Channel;
    if (dim < top_dim) return Category::Boundary;
    if (is_isolant_name(name)) return Category::Isolant;
    if (name == "Air") return Category::Air;
    return Category::Conductor;
}

}  // namespace

bool is_isolant_name(const std::string& name) {
    return name.find("Isolant") != std::string::npos || name.find("Glue") != std::string::npos ||
           name.find("Kapton") != std::string::npos;
}

std::string strip_air_prefix(const std::string& name) {
    const std::string prefix = AIR_PREFIX;
    if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
        return name.substr(prefix.size());
    }
    return name;
}

InterchangeReconciler::InterchangeReconciler(ReconcileOptions options)
    : options_(std::move(options)) {}

ReconcileResult InterchangeReconciler::reconcile(const Kernel& kernel,
                                                 const InterchangeDocument& document) const {
    auto log = logging::get_logger();
    ReconcileResult result;
    result.dim = options_.is2D ? 2 : 3;

    if (options_.expected_solids) {
        std::size_t found = kernel.entities(result.dim).size();
        if (found != *options_.expected_solids) {
            throw ValidationError("reimported model has " + std::to_string(found) +
                                  " solids, expected " +
                                  std::to_string(*options_.expected_solids));
        }
    }
    for (const auto& required : options_.required) {
        if (!document.find(required)) {
            throw GroupResolutionError(required, "not listed in the interchange file");
        }
    }

    std::map<std::string, std::string> channel_of;
    for (const auto& [channel, members] : options_.channels) {
        for (const auto& member : members) {
            channel_of[member] = channel;
        }
    }

    std::map<int, std::vector<Candidate>> pools;
    for (const auto& group : document.groups) {
        const int dim = kernel_dimension(group.dimension, options_.is2D);
        std::string name = strip_air_prefix(group.name);
        const bool required = options_.required.count(group.name) || options_.required.count(name);
        const bool hidden = options_.grouping.hide_isolants && is_isolant_name(name);
        // Required groups are matched even when hidden so their loss is not silent
        if (hidden && !required) {
            log->debug("Hiding isolant group '{}'", name);
            continue;
        }

        auto pool = pools.find(dim);
        if (pool == pools.end()) {
            pool = pools.emplace(dim, candidates(kernel, dim)).first;
        }

        DimTags tags;
        std::optional<std::size_t> failed;
        for (std::size_t i = 0; i < group.locators.size() && !failed; ++i) {
            if (auto tag = match(pool->second, group.locators[i], options_.tolerance)) {
                tags.push_back(*tag);
            } else {
                failed = i;
            }
        }
        if (group.locators.empty()) {
            failed = 0;
        }
        if (failed) {
            std::string reason = group.locators.empty()
                                     ? std::string("no locator")
                                     : "locator " + std::to_string(*failed) +
                                           " matches no entity within tolerance";
            if (required) {
                throw GroupResolutionError(group.name, reason);
            }
            log->warn("Group '{}' left out: {}", group.name, reason);
            result.warnings.push_back("group '" + group.name + "': " + reason);
            continue;
        }

        if (hidden) {
            log->debug("Hiding isolant group '{}'", name);
            result.resolved.push_back(group.name);
            continue;
        }

        auto channel = channel_of.find(name);
        const bool is_channel = channel != channel_of.end();
        const std::string path = is_channel ? channel->second : name;
        const SemanticName* semantic = result.registry.find(path);
        if (!semantic) {
            Category category = category_for(name, dim, result.dim, is_channel);
            semantic = &result.registry.register_name({path}, category, dim,
                                                      category == Category::Air);
        }
        result.lineage.bind(*semantic, tags);
        result.resolved.push_back(group.name);
    }

    result.groups = flatten(result.registry, result.lineage, options_.grouping);
    log->info("Reconciled {}/{} interchange groups of '{}' into {} physical groups",
              result.resolved.size(), document.groups.size(), document.name,
              result.groups.size());
    return result;
}

}  // namespace magnetmesh
