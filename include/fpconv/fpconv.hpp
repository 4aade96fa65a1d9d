#ifndef FPCONV_HPP
#define FPCONV_HPP

#include "fpconv/core/bits.hpp"
#include "fpconv/core/checks.hpp"
#include "fpconv/core/classification.hpp"
#include "fpconv/core/codec.hpp"
#include "fpconv/core/fields.hpp"
#include "fpconv/core/format.hpp"
#include "fpconv/core/narrow.hpp"
#include "fpconv/core/render.hpp"

#endif // FPCONV_HPP
