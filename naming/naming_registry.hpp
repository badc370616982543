#ifndef MAGNETMESH_NAMING_NAMING_REGISTRY_HPP
#define MAGNETMESH_NAMING_NAMING_REGISTRY_HPP

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace magnetmesh {

using NameId = uint32_t;

// Role of a named entity once flattened into physical groups
enum class Category { Conductor, Channel, Isolant, Structure, Boundary, Air };

std::string category_name(Category category);

// Path-qualified name, unique within one compiled assembly
struct SemanticName {
    NameId id = 0;
    std::string path;                   // segments joined with '_'
    std::vector<std::string> segments;
    Category category = Category::Conductor;
    int dim = 2;                        // dimension of the entities it names
    bool padding = false;               // air-like filler without physical meaning

    bool operator==(const SemanticName& other) const { return id == other.id; }
};

constexpr const char* PATH_SEPARATOR = "_";

std::string join_path(const std::vector<std::string>& segments);

// Assigns collision-free semantic names in registration order. Names are
// deterministic: the same sequence of registrations always yields the same
// paths.
class NamingRegistry {
public:
    // Registers the exact path; throws NamingCollisionError if it exists
    const SemanticName& register_name(const std::vector<std::string>& path, Category category,
                                      int dim, bool padding = false);

    // Appends the next sibling index to the last segment: B0, B1, ...
    const SemanticName& register_indexed(const std::vector<std::string>& path, Category category,
                                         int dim);

    const SemanticName& get(NameId id) const;
    const SemanticName* find(const std::string& path) const;
    const SemanticName& at(const std::string& path) const;

    const std::deque<SemanticName>& names() const { return names_; }
    std::size_t size() const { return names_.size(); }

private:
    // deque keeps references returned by register_* valid
    std::deque<SemanticName> names_;
    std::map<std::string, NameId> by_path_;
    std::map<std::string, uint32_t> sibling_counters_;
};

}  // namespace magnetmesh

#endif // MAGNETMESH_NAMING_NAMING_REGISTRY_HPP
