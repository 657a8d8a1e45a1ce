/**
 * chroma - color engine behind the theme color customizer
 *
 * Pure, stateless functions. Include this header for the whole engine or the
 * individual module headers below.
 */

#ifndef CHROMA_HPP
#define CHROMA_HPP

#include "convert.hpp"
#include "wcag.hpp"
#include "harmony.hpp"
#include "palette.hpp"
#include "vision.hpp"
#include "extract.hpp"

#endif // CHROMA_HPP
