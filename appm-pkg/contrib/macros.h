// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Macros Header - Attribute and visibility helpers for libappm-pkg

   ##################################################################### */
									/*}}}*/
// Private header
#ifndef APPMLIB_MACROS_H
#define APPMLIB_MACROS_H

#ifdef __GNUC__
#define APPM_GCC_VERSION (__GNUC__ << 8 | __GNUC_MINOR__)
#else
#define APPM_GCC_VERSION 0
#endif

#if APPM_GCC_VERSION >= 0x0300
	#define APPM_PURE	__attribute__((pure))
	#define APPM_PRINTF(n)	__attribute__((format(printf, n, n + 1)))
	#define APPM_UNUSED	__attribute__((unused))
#else
	#define APPM_PURE
	#define APPM_PRINTF(n)
	#define APPM_UNUSED
#endif

#if APPM_GCC_VERSION >= 0x0400
	#define APPM_PUBLIC __attribute__ ((visibility ("default")))
	#define APPM_HIDDEN __attribute__ ((visibility ("hidden")))
#else
	#define APPM_PUBLIC
	#define APPM_HIDDEN
#endif

// cold functions are rarely called
#if APPM_GCC_VERSION >= 0x0403
	#define APPM_COLD	__attribute__ ((__cold__))
#else
	#define APPM_COLD
#endif

#endif
