#include "svcreg/service_ref.hpp"
#include "svcreg/exceptions.hpp"

namespace svcreg {

void service_ref::throw_not_assignable(const type_node& target) const {
    throw registry_error("Service of type " + type_->name
                         + " is not assignable to " + target.name + ".");
}

} // namespace svcreg
