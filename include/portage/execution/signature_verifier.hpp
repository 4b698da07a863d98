#pragma once

#include <portage/schema/primitives.hpp>
#include <functional>

namespace portage::execution {

using signature_verifier_t =
    std::function<bool(const portage::schema::bytes_view_t& message,
                       const portage::schema::signer_id_t& signer,
                       const portage::schema::signature_t& signature)>;

}  // namespace portage::execution
