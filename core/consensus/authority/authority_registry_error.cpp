/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/authority/authority_registry_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dynpoa::authority, AuthorityRegistryError, e) {
  using E = dynpoa::authority::AuthorityRegistryError;
  switch (e) {
    case E::EMPTY_IDENTIFIER:
      return "Authority identifier must not be empty";
    case E::EMPTY_SECRET:
      return "Authority secret must not be empty";
    case E::INVALID_WEIGHT:
      return "Authority weight must be at least 1 and total weight of active "
             "authorities must fit 64 bits";
    case E::DUPLICATE_AUTHORITY:
      return "Authority is already registered";
    case E::UNKNOWN_AUTHORITY:
      return "Authority is not registered";
    case E::NO_SNAPSHOT_FOR_SLOT:
      return "No authority snapshot is effective for the slot";
    case E::NOT_IN_SNAPSHOT:
      return "Authority is not present in the snapshot effective for the slot";
  }
  return "unknown error (invalid AuthorityRegistryError)";
}
