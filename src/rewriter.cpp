/*
 * Rewrite UTF-8 text one indivisible segment at a time.
 *
 * The reading and writing primitives a Rewriter uses. They never throw and
 * never allocate, except for writef() when the formatted text is large.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stdarg.h>
#include	<stdio.h>

#include	<xform_config.h>
#include	<rewriter.h>

RewriteState::RewriteState(const UTF8* _src, size_t _src_len, bool _at_eof)
: src(_src)
, src_len(_src_len)
, at_eof(_at_eof)
, read_pos(0)
, write_pos(0)
, unread_width(NothingRead)
, error()
{
}

UCS4
RewriteState::readChar(int& size)
{
	const UTF8*	cp = src+read_pos;
	const UTF8*	ep = src+src_len;
	UCS4		ch = UTF8Decode(cp, ep, size);

	if (size <= 1 && ch == UCS4_REPLACEMENT	// Nothing there, or not a legal character
	 && !at_eof
	 && !UTF8FullChar(cp, ep))		// but it might be when more source arrives
	{
		setError(XformErrShortSrc);
		size = 0;
	}
	read_pos += size;
	unread_width = size;
	return ch;
}

void
RewriteState::unreadChar()
{
	switch (unread_width)
	{
	case NothingRead:
		XformContractViolation("unreadChar() called before any readChar() in this segment");
		return;

	case AlreadyUnread:
		XformContractViolation("unreadChar() called twice without an intervening readChar()");
		return;

	default:
		read_pos -= unread_width;	// Nothing happens if the last read was past the end
		unread_width = AlreadyUnread;
		return;
	}
}

size_t
RewriteState::write(const UTF8* bytes, size_t len, Error* err)
{
	Error	failure;
	size_t	accepted = put(bytes, len, failure);

	if (failure.isError())
		setError(failure);
	if (err)
		*err = failure;
	return accepted;
}

bool
RewriteState::writeChar(UCS4 ch)
{
	UTF8	buf[UTF8_MAX];
	UTF8*	cp = buf;

	UTF8Put(cp, ch);
	return writeBytes(buf, cp-buf);
}

bool
RewriteState::writef(const char* format, ...)
{
	char	buf[XFORM_FORMAT_BUFFER];
	va_list	args;

	va_start(args, format);
	int	len = vsnprintf(buf, sizeof(buf), format, args);
	va_end(args);
	if (len < 0)
	{
		setError(XformErrFormat);
		return false;
	}
	if ((size_t)len < sizeof(buf))
		return writeBytes(buf, len);

	// Too big for the stack buffer. Format it again into one that fits
	char*	big = new char[len+1];
	va_start(args, format);
	bool	ok = vsnprintf(big, len+1, format, args) == len;
	va_end(args);

	if (ok)
		ok = writeBytes(big, len);
	else
		setError(XformErrFormat);
	delete [] big;
	return ok;
}
