#include "kernel.hpp"

namespace magnetmesh {

std::string boolean_op_name(BooleanOp op) {
    switch (op) {
        case BooleanOp::Fuse: return "fuse";
        case BooleanOp::Cut: return "cut";
        case BooleanOp::Fragment: return "fragment";
        case BooleanOp::Intersect: return "intersect";
    }
    return "boolean";
}

}  // namespace magnetmesh
