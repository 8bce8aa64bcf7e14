/*
* (C) 2016,2025 Jack Lloyd
* (C) 2026 The Tacet Authors
*
* Tacet is released under the Simplified BSD License (see license.txt)
*/

#ifndef TACET_API_ANNOTATIONS_H_
#define TACET_API_ANNOTATIONS_H_

#include <tacet/build.h>

/*
* Export annotations. All of them expand to TACET_DLL; the distinction is a
* promise about stability, not about linkage.
*
* TACET_PUBLIC_API(maj, min) marks a supported entry point, first shipped in
* version maj.min, which only changes incompatibly in a new major release.
*
* TACET_UNSTABLE_API marks a symbol exported so the tools and tests can
* reach it (the assertion helpers, FFI_Error). Applications should not rely
* on it.
*/
#define TACET_PUBLIC_API(maj, min) TACET_DLL

#define TACET_UNSTABLE_API TACET_DLL

#endif
