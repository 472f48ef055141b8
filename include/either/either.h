//===- either.h - Umbrella header -------------------------------*- C++ -*-===//

#ifndef EITHER_EITHER_H
#define EITHER_EITHER_H

#include "either/codec.h"
#include "either/dispatch.h"
#include "either/either_types.h"
#include "either/error.h"
#include "either/json.h"
#include "either/msgpack.h"
#include "either/value.h"

#endif // EITHER_EITHER_H
