/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

namespace dynpoa::common {

  template class Blob<32>;

}  // namespace dynpoa::common
