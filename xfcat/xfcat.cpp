/*
 * xfcat: copy stdin to stdout through one of the standard Rewriters.
 *
 * Uses small fixed buffers, so that input characters and escapes are
 * routinely split across reads, and output routinely fills the destination.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<xformpp.h>

#include	<cstdio>
#include	<cstdlib>
#include	<cstring>
#include	<errno.h>
#include	<unistd.h>

#define	MIN_BUFFER	16	// Room for the longest segment of any standard Rewriter

static void
usage()
{
	fprintf(stderr, "Usage: xfcat [-c | -e | -u | -s | -r char] [-n] [-b size] < input > output\n");
	fprintf(stderr, "\t-c\tcopy, replacing illegal UTF-8 (default)\n");
	fprintf(stderr, "\t-e\tescape non-ASCII characters\n");
	fprintf(stderr, "\t-u\tunescape\n");
	fprintf(stderr, "\t-s\tcollapse and trim white space\n");
	fprintf(stderr, "\t-r char\treplace every character with char\n");
	fprintf(stderr, "\t-n\tprint the length of the unchanged prefix instead of the output\n");
	fprintf(stderr, "\t-b size\tbuffer size (at least %d)\n", MIN_BUFFER);
	exit(1);
}

// Fill the buffer after "used" bytes. Returns false at end of input
static bool
fill(UTF8* buf, size_t size, size_t& used)
{
	ssize_t	n;
	do
		n = read(0, buf+used, size-used);
	while (n < 0 && errno == EINTR);
	if (n < 0)
	{
		fprintf(stderr, "xfcat: read failed: %s\n", strerror(errno));
		exit(2);
	}
	used += n;
	return n > 0;
}

static void
drain(const UTF8* buf, size_t len)
{
	while (len > 0)
	{
		ssize_t	n = write(1, buf, len);
		if (n < 0 && errno == EINTR)
			continue;
		if (n <= 0)
		{
			fprintf(stderr, "xfcat: write failed: %s\n", strerror(errno));
			exit(2);
		}
		buf += n;
		len -= n;
	}
}

static void
fail(const Error& err, unsigned long offset)
{
	fprintf(stderr, "xfcat: %s at input byte %lu (error 0x%08X)\n", err.default_text(), offset, (unsigned)(int32_t)err);
	exit(3);
}

// Transform the whole input, carrying partial characters and segments over to the next read
static void
transform_stream(SpanningTransformer& xform, size_t size)
{
	UTF8*		src = new UTF8[size];
	UTF8*		dst = new UTF8[size];
	size_t		used = 0;		// Bytes held in src
	unsigned long	total = 0;		// Bytes consumed before src
	bool		eof = false;

	while (!eof || used > 0)
	{
		if (!eof && used < size)
			eof = !fill(src, size, used);

		size_t	offset = 0;
		Error	err;
		for (;;)
		{
			size_t	n_dst, n_src;
			err = xform.transform(dst, size, src+offset, used-offset, eof, n_dst, n_src);
			drain(dst, n_dst);
			offset += n_src;
			if (err != XformErrShortDst)
				break;
			if (n_dst == 0 && n_src == 0)
				fail(err, total+offset);	// A single segment that won't fit
		}

		if (err.isError()
		 && (err != XformErrShortSrc || (offset == 0 && used == size)))
			fail(err, total+offset);

		memmove(src, src+offset, used-offset);
		used -= offset;
		total += offset;
		if (eof && used > 0 && offset == 0)
			fail(XformErrShortSrc, total);	// Cannot happen when at_eof, but never spin
	}

	delete [] src;
	delete [] dst;
}

// Report the length of the prefix of the input that the transformation leaves unchanged
static void
span_stream(SpanningTransformer& xform, size_t size)
{
	UTF8*		src = new UTF8[size];
	size_t		used = 0;
	unsigned long	total = 0;
	bool		eof = false;
	Error		err;

	for (;;)
	{
		if (!eof && used < size)
			eof = !fill(src, size, used);

		size_t	n_src;
		err = xform.span(src, used, eof, n_src);
		memmove(src, src+n_src, used-n_src);
		used -= n_src;
		total += n_src;

		if (err.isError() && err != XformErrShortSrc)
			break;			// The span ends here
		if (eof)
			break;			// All input spanned
		if (n_src == 0 && used == size)
			break;			// No progress possible in this buffer size
	}

	printf("%lu\n", total);
	if (err.isError() && err != XformErrEndOfSpan)
		fprintf(stderr, "xfcat: stopped: %s\n", err.default_text());
	delete [] src;
}

int
main(int argc, const char** argv)
{
	CopyRewriter		copy;
	EscapeRewriter		escape;
	UnescapeRewriter	unescape;
	CleanSpaces		clean;
	ReplaceRewriter		replace;
	Rewriter*		rewriter = &copy;
	bool			spanning = false;
	size_t			size = 4096;

	for (--argc, ++argv; argc > 0; argc--, argv++)
	{
		if (0 == strcmp("-c", *argv))
			rewriter = &copy;
		else if (0 == strcmp("-e", *argv))
			rewriter = &escape;
		else if (0 == strcmp("-u", *argv))
			rewriter = &unescape;
		else if (0 == strcmp("-s", *argv))
			rewriter = &clean;
		else if (0 == strcmp("-r", *argv) && argc > 1)
		{
			const UTF8*	cp = argv[1];
			int		width;
			replace = ReplaceRewriter(UTF8Decode(cp, cp+strlen(cp), width));
			rewriter = &replace;
			argc--, argv++;
		}
		else if (0 == strcmp("-n", *argv))
			spanning = true;
		else if (0 == strcmp("-b", *argv) && argc > 1)
		{
			size = strtoul(argv[1], 0, 10);
			argc--, argv++;
		}
		else
			usage();
	}
	if (size < MIN_BUFFER)
		usage();

	RewriteTransformer	xform(*rewriter);
	if (spanning)
		span_stream(xform, size);
	else
		transform_stream(xform, size);
	return 0;
}
