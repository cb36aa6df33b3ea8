#if !defined(XFORMPP_H)
#define XFORMPP_H
/*
 * Streaming UTF-8 rewriting.
 * - Caller-supplied Rewriters, each rewriting one indivisible segment at a time
 * - All-or-nothing segments: a failed segment leaves no trace in the output
 * - Resumable across partial source buffers and full destination buffers
 * - A span mode that finds the unchanged prefix without writing any output
 * - Strict UTF-8, with illegal bytes replaced one at a time
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<xform_config.h>
#include	<char_encoding.h>
#include	<error.h>
#include	<xform_error.h>
#include	<rewriter.h>
#include	<transformer.h>
#include	<rewriters.h>

#endif	// XFORMPP_H
