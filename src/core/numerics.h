#pragma once

// Public entry point: containers, operations and kernel backend control.
#include "element.h"
#include "storage.h"
#include "array.h"
#include "vector.h"
#include "matrix.h"
#include "ops.h"
#include "kernels.h"
