#pragma once

#include <string>

namespace UuidHelper {

/**
 * @brief Generate a random (version 4) UUID in canonical lowercase form
 */
std::string generate();

/**
 * @brief Generate a local temporary token for an optimistic message ("pending:<uuid>")
 */
std::string pendingToken();

} // namespace UuidHelper
