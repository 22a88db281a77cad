#pragma once

namespace svcreg {

/// The three query families a registry answers.  Used to phrase
/// not-found and closed-registry messages.
enum class lookup_kind {
    service,
    factory,
    all_services
};

} // namespace svcreg
