#if !defined(TRANSFORMER_H)
#define TRANSFORMER_H
/*
 * Streaming transformers over UTF-8 byte buffers.
 *
 * A SpanningTransformer converts a source buffer into a destination buffer,
 * a piece at a time. Each call reports how many destination bytes it wrote
 * and how many source bytes it consumed, and returns an Error if it could not
 * consume everything:
 *	XformErrShortSrc	the source ends part-way through something; call
 *				again with the unconsumed bytes and more after them.
 *	XformErrShortDst	the destination is full; drain it and call again
 *				with the unconsumed source.
 *	anything else		invalid input, as reported by the transformation.
 * Because the output of one call is just a buffer, transformers can be chained
 * by feeding one's destination to the next one's source.
 *
 * span() does no writing at all. It reports how much of the source the
 * transformation would leave unchanged, so a caller can avoid copying it.
 *
 * RewriteTransformer is the engine that runs a Rewriter (see rewriter.h) over
 * the source, one segment at a time, checkpointing after each good segment.
 * The positions it reports are always checkpoints, so a failed segment leaves
 * no trace and the caller resumes exactly where it should.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stddef.h>
#include	<vector>

#include	<error.h>
#include	<rewriter.h>

class	SpanningTransformer
{
public:
	virtual		~SpanningTransformer() {}

	virtual Error	transform(
				UTF8*		dst,		// Destination buffer
				size_t		dst_len,	// and its capacity
				const UTF8*	src,		// Source buffer
				size_t		src_len,	// and the bytes in it
				bool		at_eof,		// No more source will follow
				size_t&		n_dst,		// Bytes written to dst
				size_t&		n_src		// Bytes consumed from src
			) = 0;
	virtual Error	span(
				const UTF8*	src,
				size_t		src_len,
				bool		at_eof,
				size_t&		n_src		// Bytes that would be unchanged
			) = 0;
	virtual void	reset() = 0;			// Discard any state carried between calls

	// Reset, then transform the whole of src into out, growing it as needed.
	// On any error, out is emptied.
	Error		transformAll(const UTF8* src, size_t src_len, std::vector<UTF8>& out);

	// Reset, then span the whole of src
	Error		spanAll(const UTF8* src, size_t src_len, size_t& n_src)
			{
				reset();
				return span(src, src_len, true, n_src);
			}
};

class	RewriteTransformer
: public SpanningTransformer
{
public:
	RewriteTransformer(Rewriter& _rewriter)	// The Rewriter must outlive this
	: rewriter(_rewriter)
	{ }

	Error		transform(UTF8* dst, size_t dst_len, const UTF8* src, size_t src_len, bool at_eof, size_t& n_dst, size_t& n_src);
	Error		span(const UTF8* src, size_t src_len, bool at_eof, size_t& n_src);
	void		reset() { rewriter.reset(); }

protected:
	Error		run(RewriteState& state, bool spanning, size_t& n_dst, size_t& n_src);

	Rewriter&	rewriter;
};

#endif	// TRANSFORMER_H
