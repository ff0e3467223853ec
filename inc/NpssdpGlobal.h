#ifndef NPSSDPGLOBAL_H
#define NPSSDPGLOBAL_H

/*!
 * \file
 *
 * \brief Defines constants that for some reason are not defined on some
 * systems.
 */

#if defined(__GNUC__) && __GNUC__ >= 4
    /*! Export functions from the shared library. */
    #define EXPORT_SPEC __attribute__((visibility("default")))
#else
    #define EXPORT_SPEC
#endif

/* Sized integer types. */
#include <stdint.h>

#endif /* NPSSDPGLOBAL_H */
