#if !defined(XFORM_ERROR_H)
#define XFORM_ERROR_H
/*
 * Errors reported by the rewriting engine.
 *
 * SHORT_SRC and SHORT_DST are the normal, resumable results of streaming:
 * supply more source, or more destination space, and call again from the
 * returned checkpoint. END_OF_SPAN is returned only by span(), where the
 * rewritten text first differs from the source. NO_PROGRESS is returned only
 * when a contract violation handler returns instead of stopping the program.
 * FORMAT means RewriteState::writef() got an error from the C library, such
 * as a wide character that has no encoding in the current locale.
 *
 * Errors a Rewriter sets for invalid input use their own message sets and are
 * passed back to the caller unchanged.
 *
 * A contract violation is a Rewriter misusing the RewriteState, such as
 * unreading twice. It is a bug, not a condition to recover from. The default
 * handler prints the message and aborts; a test may install a handler that
 * throws. If an installed handler returns, the offending call has no effect.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<error.h>

#define	XFORMERR_SET		3	// Message set number for the rewriting engine
#define	XFORMERR_SHORT_SRC	1	// Source ends part-way through a character or segment
#define	XFORMERR_SHORT_DST	2	// Destination has no room for the next segment
#define	XFORMERR_END_OF_SPAN	3	// Rewritten text differs from the source here
#define	XFORMERR_NO_PROGRESS	4	// The Rewriter consumed no input
#define	XFORMERR_FORMAT		5	// writef() could not format its arguments

constexpr Error	XformErrShortSrc(ErrNum(XFORMERR_SET, XFORMERR_SHORT_SRC), "short source buffer");
constexpr Error	XformErrShortDst(ErrNum(XFORMERR_SET, XFORMERR_SHORT_DST), "short destination buffer");
constexpr Error	XformErrEndOfSpan(ErrNum(XFORMERR_SET, XFORMERR_END_OF_SPAN), "end of span");
constexpr Error	XformErrNoProgress(ErrNum(XFORMERR_SET, XFORMERR_NO_PROGRESS), "rewriter consumed no input");
constexpr Error	XformErrFormat(ErrNum(XFORMERR_SET, XFORMERR_FORMAT), "formatted write failed");

typedef	void	(*XformContractHandler)(const char* message);

XformContractHandler	XformSetContractHandler(XformContractHandler handler);	// Returns the previous handler
void			XformContractViolation(const char* message);

#endif	// XFORM_ERROR_H
