#include "naming_registry.hpp"

#include <common/errors.hpp>

#include <stdexcept>

namespace magnetmesh {

std::string category_name(Category category) {
    switch (category) {
        case Category::Conductor: return "conductor";
        case Category::Channel: return "channel";
        case Category::Isolant: return "isolant";
        case Category::Structure: return "structure";
        case Category::Boundary: return "boundary";
        case Category::Air: return "air";
    }
    return "unknown";
}

std::string join_path(const std::vector<std::string>& segments) {
    std::string path;
    for (const auto& segment : segments) {
        if (segment.empty()) continue;
        if (!path.empty()) path += PATH_SEPARATOR;
        path += segment;
    }
    return path;
}

const SemanticName& NamingRegistry::register_name(const std::vector<std::string>& path,
                                                  Category category, int dim, bool padding) {
    SemanticName name;
    name.id = static_cast<NameId>(names_.size());
    name.path = join_path(path);
    name.segments = path;
    name.category = category;
    name.dim = dim;
    name.padding = padding;

    if (name.path.empty()) {
        throw ValidationError("cannot register an empty semantic path");
    }
    if (!by_path_.emplace(name.path, name.id).second) {
        throw NamingCollisionError(name.path);
    }
    names_.push_back(std::move(name));
    return names_.back();
}

const SemanticName& NamingRegistry::register_indexed(const std::vector<std::string>& path,
                                                     Category category, int dim) {
    if (path.empty()) {
        throw ValidationError("cannot register an empty semantic path");
    }
    uint32_t& counter = sibling_counters_[join_path(path)];
    std::vector<std::string> indexed = path;
    indexed.back() += std::to_string(counter++);
    return register_name(indexed, category, dim);
}

const SemanticName& NamingRegistry::get(NameId id) const {
    if (id >= names_.size()) {
        throw std::out_of_range("unknown semantic name id " + std::to_string(id));
    }
    return names_[id];
}

const SemanticName* NamingRegistry::find(const std::string& path) const {
    auto it = by_path_.find(path);
    return it == by_path_.end() ? nullptr : &names_[it->second];
}

const SemanticName& NamingRegistry::at(const std::string& path) const {
    const SemanticName* name = find(path);
    if (!name) {
        throw std::out_of_range("unknown semantic name '" + path + "'");
    }
    return *name;
}

}  // namespace magnetmesh
