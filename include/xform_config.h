#if !defined(XFORM_CONFIG_H)
#define XFORM_CONFIG_H
/*
 * Compile-time configuration for the rewriting engine.
 *
 * Define any of these on the compiler command line to override the defaults:
 *	XFORM_TRACE		Print each engine checkpoint and stop reason to stderr
 *	XFORM_FORMAT_BUFFER	Bytes formatted on the stack by RewriteState::writef before using the heap
 *	XFORM_INITIAL_OUTPUT	Smallest destination transformAll() starts with
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stdio.h>

#if	!defined(XFORM_FORMAT_BUFFER)
#define	XFORM_FORMAT_BUFFER	64
#endif

#if	!defined(XFORM_INITIAL_OUTPUT)
#define	XFORM_INITIAL_OUTPUT	64
#endif

#if	defined(XFORM_TRACE)
#define	XFORM_TRACEF(...)	fprintf(stderr, __VA_ARGS__)
#else
#define	XFORM_TRACEF(...)	do {} while (0)
#endif

#endif	// XFORM_CONFIG_H
