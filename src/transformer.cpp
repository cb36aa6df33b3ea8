/*
 * Streaming transformers over UTF-8 byte buffers.
 *
 * RewriteTransformer runs a Rewriter over the source one segment at a time.
 * After each segment that sets no error, the cursor positions become the new
 * checkpoint. When a segment does set an error, the loop stops and reports
 * the previous checkpoint, so whatever that segment read or wrote is ignored.
 *
 * transform() and span() differ only in the cursor they build; the loop is
 * the same, except that span() ends at the first segment after which the
 * (virtual) output is not exactly level with the input. From there on, the
 * source consumed does not map onto itself, even if every byte written matched.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<xform_config.h>
#include	<transformer.h>

Error
RewriteTransformer::transform(UTF8* dst, size_t dst_len, const UTF8* src, size_t src_len, bool at_eof, size_t& n_dst, size_t& n_src)
{
	TransformCursor	cursor(DestinationOutput(dst, dst_len), src, src_len, at_eof);

	return run(cursor, false, n_dst, n_src);
}

Error
RewriteTransformer::span(const UTF8* src, size_t src_len, bool at_eof, size_t& n_src)
{
	SpanCursor	cursor(SpanOutput(), src, src_len, at_eof);
	size_t		n_dst;

	return run(cursor, true, n_dst, n_src);
}

Error
RewriteTransformer::run(RewriteState& state, bool spanning, size_t& n_dst, size_t& n_src)
{
	const char*	mode = spanning ? "span" : "transform";

	n_dst = 0;
	n_src = 0;
	while (state.read_pos < state.src_len)
	{
		// Never hand the Rewriter a source that ends in a partial character, unless it's all there is
		if (!state.at_eof
		 && !UTF8FullChar(state.src+state.read_pos, state.src+state.src_len))
		{
			XFORM_TRACEF("%s: short source at %lu, checkpoint (%lu, %lu)\n",
				mode, (unsigned long)state.read_pos, (unsigned long)n_dst, (unsigned long)n_src);
			return XformErrShortSrc;
		}

		size_t	segment_start = state.read_pos;
		state.beginSegment();
		rewriter.rewrite(state);

		if (state.error.isError())
		{
			XFORM_TRACEF("%s: \"%s\" in segment at %lu, checkpoint (%lu, %lu)\n",
				mode, state.error.default_text(), (unsigned long)segment_start,
				(unsigned long)n_dst, (unsigned long)n_src);
			return state.error;
		}
		if (state.read_pos <= segment_start)
		{
			XformContractViolation("rewrite() returned without consuming any input");
			return XformErrNoProgress;
		}

		if (spanning && state.write_pos != state.read_pos)
		{
			// Successful, but the source consumed no longer maps onto itself. Never resume past here
			XFORM_TRACEF("%s: output at %lu doesn't line up with input at %lu, checkpoint %lu\n",
				mode, (unsigned long)state.write_pos, (unsigned long)state.read_pos, (unsigned long)n_src);
			return XformErrEndOfSpan;
		}

		n_dst = state.write_pos;
		n_src = state.read_pos;
		XFORM_TRACEF("%s: checkpoint (%lu, %lu)\n", mode, (unsigned long)n_dst, (unsigned long)n_src);
	}
	return Error();
}

Error
SpanningTransformer::transformAll(const UTF8* src, size_t src_len, std::vector<UTF8>& out)
{
	size_t		produced = 0;
	size_t		consumed = 0;
	size_t		capacity = src_len + src_len/8;

	reset();
	if (capacity < XFORM_INITIAL_OUTPUT)
		capacity = XFORM_INITIAL_OUTPUT;
	out.resize(capacity);

	for (;;)
	{
		size_t	n_dst;
		size_t	n_src;
		Error	err = transform(
				out.data()+produced, out.size()-produced,
				src+consumed, src_len-consumed,
				true,
				n_dst, n_src
			);
		produced += n_dst;
		consumed += n_src;

		if (err != XformErrShortDst)
		{
			if (err.isError())
				out.clear();
			else
				out.resize(produced);
			return err;
		}
		out.resize(out.size()*2);	// Resume from the checkpoint with more room
	}
}
