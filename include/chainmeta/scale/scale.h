#ifndef CHAINMETA_SCALE_H
#define CHAINMETA_SCALE_H

// Umbrella header for the binary codec
#include "reader.h"
#include "writer.h"
#include "traits.h"

#endif // CHAINMETA_SCALE_H
