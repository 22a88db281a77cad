#pragma once

#include "svcreg/export.hpp"
#include "svcreg/fwd.hpp"
#include "svcreg/lookup_kind.hpp"
#include "svcreg/lifecycle.hpp"
#include "svcreg/exceptions.hpp"
#include "svcreg/type_traits.hpp"
#include "svcreg/type_node.hpp"
#include "svcreg/type_key.hpp"
#include "svcreg/service_ref.hpp"
#include "svcreg/factory.hpp"
#include "svcreg/service_registry.hpp"
#include "svcreg/descriptor.hpp"
#include "svcreg/registry.hpp"
