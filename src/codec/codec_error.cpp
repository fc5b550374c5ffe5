/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/codec_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kvext::codec, CodecError, e) {
  using E = kvext::codec::CodecError;
  switch (e) {
    case E::NOT_REGISTERED:
      return "no codec registered for type";
    case E::NOT_FIXED_WIDTH:
      return "codec of scalar collection element must be fixed-width";
  }
  return "unknown CodecError";
}
