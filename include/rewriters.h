#if !defined(REWRITERS_H)
#define REWRITERS_H
/*
 * Some generally useful Rewriters, each also a model for writing your own.
 *
 *	CopyRewriter		Copies the input. Illegal bytes become UCS4_REPLACEMENT
 *	ReplaceRewriter		Replaces every character with a single filler character
 *	CleanSpaces		Collapses white space runs to one space, trimming both ends
 *	EscapeRewriter		Escapes non-ASCII as \uXXXX or \UXXXXXXXX, and \ as \\
 *	UnescapeRewriter	Reverses EscapeRewriter
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rewriter.h>

class	CopyRewriter
: public Rewriter
{
public:
	void		rewrite(RewriteState& state);
};

class	ReplaceRewriter
: public Rewriter
{
public:
	ReplaceRewriter(UCS4 _filler = '?') : filler(_filler) {}
	void		rewrite(RewriteState& state);

private:
	UCS4		filler;
};

// Handles one character per segment. Remembers a pending space between segments.
class	CleanSpaces
: public Rewriter
{
public:
	CleanSpaces() : not_first(false), found_space(false) {}
	void		rewrite(RewriteState& state);
	void		reset() { not_first = false; found_space = false; }

private:
	bool		not_first;	// Something other than space has been written
	bool		found_space;	// A space is owed before the next non-space
};

class	EscapeRewriter
: public Rewriter
{
public:
	void		rewrite(RewriteState& state);
};

/*
 * An escape is a whole segment, so a partial escape at the end of a buffer
 * is retried in full when more source arrives. A malformed escape produces
 * UCS4_REPLACEMENT; a non-hex character ending one early is left to be read
 * again as ordinary input.
 */
class	UnescapeRewriter
: public Rewriter
{
public:
	void		rewrite(RewriteState& state);
};

#endif	// REWRITERS_H
