#if !defined(REWRITER_H)
#define REWRITER_H
/*
 * Rewrite UTF-8 text one indivisible segment at a time.
 *
 * A Rewriter is handed a RewriteState, reads one or more characters from it,
 * and writes zero or more bytes in their place. A call to Rewriter::rewrite
 * either succeeds completely, or (if any error gets set on the state) has all
 * its reads and writes discarded. The engine that drives it (see transformer.h)
 * only ever reports positions between whole, successful segments.
 *
 * The same Rewriter runs in two modes. When transforming, writes go to a real
 * destination buffer and fail with XformErrShortDst if it is full. When
 * spanning, there is no destination: each write is compared with the source
 * at the same offset, and fails with XformErrEndOfSpan where they differ.
 * A Rewriter can't tell which mode it is in, and shouldn't care.
 *
 * A RewriteState exists only for the duration of one engine call. A Rewriter
 * must not keep a pointer to it past the end of rewrite().
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stddef.h>
#include	<string.h>
#include	<functional>

#include	<char_encoding.h>
#include	<xform_error.h>

class	RewriteState;

/*
 * Rewrite must be called with a RewriteState representing non-empty input,
 * and must consume at least one character unless it sets an error.
 * A Rewriter that keeps private state between segments should change it only
 * once the writes for the segment have succeeded, and clear it in reset().
 */
class	Rewriter
{
public:
	virtual		~Rewriter() {}
	virtual void	rewrite(RewriteState& state) = 0;
	virtual void	reset() {}
};

// Adapt an ordinary function (or lambda) to a stateless Rewriter
class	RewriterFunc
: public Rewriter
{
public:
	using Func = std::function<void(RewriteState& state)>;

	RewriterFunc(Func f) : func(f) {}
	void		rewrite(RewriteState& state) { func(state); }

private:
	Func		func;
};

class	RewriteState
{
public:
	// Read the next character and its length in bytes. An illegal byte is
	// returned as UCS4_REPLACEMENT with size 1. At the end of the source, or
	// part-way through a character, size is 0; if more source is still to
	// come, XformErrShortSrc is also set.
	UCS4		readChar(int& size);
	UCS4		readChar()
			{ int size; return readChar(size); }

	// Put back the last character read, so the next segment starts with it.
	// Allowed once after each readChar(); a no-op if that read had size 0.
	void		unreadChar();

	bool		atEOF() const { return at_eof; }
	size_t		available() const { return src_len-read_pos; }
	size_t		readPosition() const { return read_pos; }
	size_t		writePosition() const { return write_pos; }

	// Each write either succeeds in full, or sets an error and returns false
	bool		writeBytes(const UTF8* bytes, size_t len)
			{ return write(bytes, len) == len; }
	bool		writeString(const char* str)
			{ return writeBytes(str, strlen(str)); }
	bool		writeChar(UCS4 ch);	// Unencodable characters are written as UCS4_REPLACEMENT
	// printf-style. If the C library can't format the arguments, sets XformErrFormat
	bool		writef(const char* format, ...)
#if	defined(__GNUC__)
			__attribute__((format(printf, 2, 3)))
#endif
			;

	// Writer-style: returns the number of bytes accepted, and the error (if any) in *err
	size_t		write(const UTF8* bytes, size_t len, Error* err = 0);

	// Report invalid input. Only the first error set survives
	void		setError(Error e)
			{ if (!error.isError()) error = e; }
	Error		getError() const { return error; }

protected:
	RewriteState(const UTF8* _src, size_t _src_len, bool _at_eof);
	RewriteState(const RewriteState&) = delete;
	RewriteState&	operator=(const RewriteState&) = delete;
	virtual		~RewriteState() {}

	// Write at write_pos, advancing it over the bytes accepted. Set failure if not all were
	virtual size_t	put(const UTF8* bytes, size_t len, Error& failure) = 0;

	void		beginSegment() { unread_width = NothingRead; }

	enum {
		NothingRead = -1,	// No readChar() yet in this segment
		AlreadyUnread = -2	// unreadChar() was the last call
	};

	const UTF8*	src;
	size_t		src_len;
	bool		at_eof;		// No more source will follow src
	size_t		read_pos;
	size_t		write_pos;	// In span mode, the offset in src that writes are compared at
	int		unread_width;	// Size of the last readChar(), or NothingRead or AlreadyUnread
	Error		error;		// Sticky: first error wins

	friend class	RewriteTransformer;
};

/*
 * A RewriteState whose writes are committed by an Output. The two engine modes
 * are the two Outputs below, so reading, checkpointing and error handling are
 * shared code.
 *
 * An Output provides:
 *	size_t put(const UTF8* src, size_t src_len, size_t at, const UTF8* bytes, size_t len, Error& failure);
 * returning how many bytes it accepted at offset "at".
 */
template<typename Output>
class	RewriteCursor
: public RewriteState
{
public:
	RewriteCursor(const Output& _output, const UTF8* _src, size_t _src_len, bool _at_eof)
	: RewriteState(_src, _src_len, _at_eof)
	, output(_output)
	{ }

protected:
	size_t		put(const UTF8* bytes, size_t len, Error& failure)
			{
				size_t	accepted = output.put(src, src_len, write_pos, bytes, len, failure);
				write_pos += accepted;
				return accepted;
			}

	Output		output;
};

// Copy whole writes into a fixed-size destination, or accept nothing
class	DestinationOutput
{
public:
	DestinationOutput(UTF8* _dst, size_t _dst_len)
	: dst(_dst)
	, dst_len(_dst_len)
	{ }

	size_t		put(const UTF8* src, size_t src_len, size_t at, const UTF8* bytes, size_t len, Error& failure)
			{
				if (len > dst_len-at)
				{
					failure = XformErrShortDst;
					return 0;
				}
				if (len > 0)
					memcpy(dst+at, bytes, len);
				return len;
			}

private:
	UTF8*		dst;
	size_t		dst_len;
};

// Compare writes with the source. Accept the matching prefix; running past the end is a mismatch
class	SpanOutput
{
public:
	size_t		put(const UTF8* src, size_t src_len, size_t at, const UTF8* bytes, size_t len, Error& failure)
			{
				size_t	matched = 0;
				while (matched < len
				    && at+matched < src_len
				    && bytes[matched] == src[at+matched])
					matched++;
				if (matched < len)
					failure = XformErrEndOfSpan;
				return matched;
			}
};

typedef	RewriteCursor<DestinationOutput>	TransformCursor;
typedef	RewriteCursor<SpanOutput>		SpanCursor;

#endif	// REWRITER_H
