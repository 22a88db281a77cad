#include "svcreg/type_node.hpp"

#include <vector>

namespace svcreg {

bool type_node::is_a(const type_node& other) const {
    if (other.is_top || id == other.id) return true;
    for (const auto& base : bases) {
        if (base.type->is_a(other)) return true;
    }
    return false;
}

void* type_node::cast(void* p, const type_node& target) const {
    if (!p) return nullptr;
    if (target.is_top || id == target.id) return p;
    for (const auto& base : bases) {
        if (void* r = base.type->cast(base.upcast(p), target)) return r;
    }
    return nullptr;
}

namespace {

void collect_products(const type_node& node, std::vector<const type_node*>& out) {
    if (node.product) out.push_back(node.product);
    for (const auto& base : node.bases) {
        collect_products(*base.type, out);
    }
}

} // namespace

std::vector<const type_node*> type_node::factory_products() const {
    std::vector<const type_node*> out;
    collect_products(*this, out);
    return out;
}

} // namespace svcreg
