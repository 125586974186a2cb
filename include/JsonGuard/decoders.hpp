#pragma once

#include "value.hpp"
#include "render.hpp"
#include "result.hpp"
#include "errors.hpp"
#include "decoder.hpp"
#include "primitives.hpp"
#include "struct_fields.hpp"
#include "object.hpp"
#include "collections.hpp"
#include "combinators.hpp"
#include "modifiers.hpp"
#include "exact.hpp"
