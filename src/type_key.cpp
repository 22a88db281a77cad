#include "svcreg/type_key.hpp"
#include "svcreg/exceptions.hpp"

namespace svcreg {

type_key type_key::service(const type_node& type) noexcept {
    request_shape shape = request_shape::service;
    if (type.is_array) {
        shape = request_shape::array;
    } else if (type.is_raw_factory) {
        shape = request_shape::raw_factory;
    }
    return type_key(shape, &type, variance::exact);
}

type_key type_key::factory(const type_node& product, variance bound) noexcept {
    return type_key(product.is_array ? request_shape::array : request_shape::factory,
                    &product, bound);
}

void type_key::validate() const {
    switch (shape_) {
    case request_shape::array:
        throw invalid_request("Cannot locate service of array type " + type_->name + ".");
    case request_shape::raw_factory:
        throw invalid_request("Cannot locate service of raw type " + type_->name + ".");
    case request_shape::service:
    case request_shape::factory:
        break;
    }
}

bool type_key::matches(const type_node& declared) const {
    switch (shape_) {
    case request_shape::service:
        return declared.is_a(*type_);
    case request_shape::factory:
        for (const type_node* product : declared.factory_products()) {
            switch (bound_) {
            case variance::exact:
                if (product->id == type_->id) return true;
                break;
            case variance::extends:
                if (product->is_a(*type_)) return true;
                break;
            case variance::super:
                if (type_->is_a(*product)) return true;
                break;
            }
        }
        return false;
    case request_shape::raw_factory:
    case request_shape::array:
        break;
    }
    return false;
}

std::string type_key::display_name() const {
    if (shape_ != request_shape::factory) return type_->name;
    switch (bound_) {
    case variance::extends:
        return "factory<? extends " + type_->name + ">";
    case variance::super:
        return "factory<? super " + type_->name + ">";
    case variance::exact:
        break;
    }
    return "factory<" + type_->name + ">";
}

} // namespace svcreg
