#if !defined(CHAR_ENCODING_H)
#define CHAR_ENCODING_H
/*
 * Encode/decode characters between UTF-8 and UCS4, over length-bounded buffers.
 *
 * UCS4 (AKA UTF-32, Rune) is the ISO/IEC 10646 32-bit character encoding.
 * Only Unicode scalar values are valid here: U+0000..U+10FFFF, excluding the
 * UTF-16 surrogates U+D800..U+DFFF.
 *
 * A UTF8 character is represented as 1-4 bytes, as the Unicode standard defines.
 * A first byte with a most significant bit of zero is a single ASCII byte.
 * The bytes after the first always have most significant two bits == "10",
 * which never occurs in the first byte.
 *
 * Decoding is strict. Overlong forms, encoded surrogates and values above
 * U+10FFFF are all illegal. An illegal sequence decodes as UCS4_REPLACEMENT
 * and consumes exactly one byte, so decoding always makes progress and
 * re-synchronises at the next byte.
 *
 * Because a stream may be split anywhere, a buffer can end part-way through
 * a character. UTF8FullChar() says whether the bytes available are enough to
 * decide what the next character is; a truncated but so-far-legal prefix is
 * not, but an illegal first byte (which will only ever consume itself) is.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stddef.h>
#include	<cstdint>

typedef char		UTF8;		// We don't assume un/signed
typedef	char32_t	UCS4;		// A UCS4 character, aka UTF-32, aka Rune

#define	UCS4_NONE	0xFFFFFFFF	// Marker indicating no UCS4 character
#define	UCS4_REPLACEMENT ((UCS4)0x0000FFFD)	// substitute for an unknown char
#define	UCS4_NO_GLYPH	"\xEF\xBF\xBD"	// UTF8 for UCS4_REPLACEMENT
#define	UCS4_MAX	((UCS4)0x0010FFFF)	// Largest Unicode code point
#define	UTF8_MAX	4		// Longest UTF8 encoding of a Unicode character

/*
 * UCS4 classification
 */
inline bool	UCS4IsWhite(UCS4 ch)	// The Unicode White_Space property
		{
			return (ch >= '\t' && ch <= '\r')
				|| ch == ' '
				|| ch == 0x0085
				|| ch == 0x00A0
				|| ch == 0x1680
				|| (ch >= 0x2000 && ch <= 0x200A)
				|| (ch >= 0x2028 && ch <= 0x2029)
				|| ch == 0x202F
				|| ch == 0x205F
				|| ch == 0x3000;
		}
inline bool	UCS4IsASCII(UCS4 ch) { return ch < 0x00000080; }
inline bool	UCS4IsUnicode(UCS4 ch) { return ch <= UCS4_MAX; }
inline bool	UCS4IsSurrogate(UCS4 ch) { return ch >= 0xD800 && ch <= 0xDFFF; }
inline bool	UCS4IsValid(UCS4 ch)	// Can this character be encoded at all?
		{ return UCS4IsUnicode(ch) && !UCS4IsSurrogate(ch); }

inline bool
UTF8Is2nd(UTF8 ch)
{
	return (ch & 0xC0) == 0x80;	// A non-1st byte is always 0b10xx_xxxx
}

/*
 * What a first byte says about the sequence it introduces: the length, and
 * the range allowed for the second byte. The narrowed ranges after E0, ED,
 * F0 and F4 are what exclude overlong forms, surrogates and values > U+10FFFF.
 * A length of zero means this byte can never start a character.
 */
struct	UTF8Lead
{
	int		len;
	unsigned char	lo;
	unsigned char	hi;
};

inline UTF8Lead
UTF8LeadOf(UTF8 c)
{
	unsigned char	b = (unsigned char)c;
	UTF8Lead	lead = { 0, 0x80, 0xBF };

	// 0x80..0xC1 are trailing bytes or overlong 2-byte leads, and stay at zero
	if (b < 0x80)
		lead.len = 1;			// 0b0xxx_xxxx ASCII
	else if (b >= 0xC2 && b < 0xE0)
		lead.len = 2;			// 0b110x_xxxx
	else if (b >= 0xE0 && b < 0xF0)
	{
		lead.len = 3;			// 0b1110_xxxx
		if (b == 0xE0)
			lead.lo = 0xA0;		// Overlong below U+0800
		else if (b == 0xED)
			lead.hi = 0x9F;		// Surrogates
	}
	else if (b >= 0xF0 && b < 0xF5)
	{
		lead.len = 4;			// 0b1111_0xxx
		if (b == 0xF0)
			lead.lo = 0x90;		// Overlong below U+10000
		else if (b == 0xF4)
			lead.hi = 0x8F;		// Above U+10FFFF
	}
	return lead;
}

// From a candidate UTF8 first byte, return the length of the UTF8 sequence it introduces, or 0
inline int
UTF8CorrectLen(UTF8 c)
{
	return UTF8LeadOf(c).len;
}

// Get length of UTF8 from UCS4. Characters that can't be encoded are written as UCS4_REPLACEMENT
inline int
UTF8Len(UCS4 ch)
{
	if (ch < (1<<7))	// 7 bits:
		return 1;	// ASCII
	if (ch < (1<<11))	// 11 bits:
		return 2;	// two bytes
	if (ch < (1<<16))	// 16 bits
		return 3;	// three bytes, including a replaced surrogate
	if (ch <= UCS4_MAX)	// 21 bits, but capped
		return 4;	// four bytes
	return 3;		// UCS4_REPLACEMENT
}

/*
 * Are there enough bytes between cp and ep to decide the next character?
 * True if a complete legal sequence is present, and also if the bytes present
 * are already known to be illegal. False for no bytes, or a legal but
 * incomplete prefix.
 */
inline bool
UTF8FullChar(const UTF8* cp, const UTF8* ep)
{
	if (cp >= ep)
		return false;
	UTF8Lead	lead = UTF8LeadOf(*cp);
	ptrdiff_t	avail = ep-cp;
	if (lead.len == 0 || avail >= lead.len)
		return true;
	if (avail > 1
	 && ((unsigned char)cp[1] < lead.lo || (unsigned char)cp[1] > lead.hi))
		return true;		// Illegal 2nd byte, will decode as a replacement
	if (avail > 2 && !UTF8Is2nd(cp[2]))
		return true;		// Illegal 3rd byte
	return false;
}

/*
 * Decode one character from the bytes between cp and ep, setting width to
 * the number of bytes it occupies. An empty buffer yields (UCS4_REPLACEMENT, 0).
 * An illegal or truncated sequence yields (UCS4_REPLACEMENT, 1).
 */
inline UCS4
UTF8Decode(const UTF8* cp, const UTF8* ep, int& width)
{
	if (cp >= ep)
	{
		width = 0;
		return UCS4_REPLACEMENT;
	}

	UTF8Lead	lead = UTF8LeadOf(*cp);
	ptrdiff_t	avail = ep-cp;
	unsigned char	b1, b2, b3;

	switch (lead.len)
	{
	case 1:
		width = 1;
		return (UCS4)(cp[0] & 0x7F);

	case 2:
	case 3:
	case 4:
		if (avail < lead.len)
			break;
		b1 = (unsigned char)cp[1];
		if (b1 < lead.lo || b1 > lead.hi)
			break;
		if (lead.len == 2)
		{
			width = 2;
			return ((UCS4)(cp[0]&0x1F)<<6) | (b1&0x3F);
		}
		b2 = (unsigned char)cp[2];
		if (!UTF8Is2nd(b2))
			break;
		if (lead.len == 3)
		{
			width = 3;
			return ((UCS4)(cp[0]&0x0F)<<12) | ((UCS4)(b1&0x3F)<<6) | (b2&0x3F);
		}
		b3 = (unsigned char)cp[3];
		if (!UTF8Is2nd(b3))
			break;
		width = 4;
		return ((UCS4)(cp[0]&0x07)<<18) | ((UCS4)(b1&0x3F)<<12) | ((UCS4)(b2&0x3F)<<6) | (b3&0x3F);

	case 0:
	default:
		break;
	}
	width = 1;		// Illegal: consume just the first byte
	return UCS4_REPLACEMENT;
}

// Store UTF8 from UCS4, advancing cp. There must be room for UTF8Len(ch) bytes
inline void
UTF8Put(UTF8*& cp, UCS4 ch)
{
	if (!UCS4IsValid(ch))
		ch = UCS4_REPLACEMENT;

	switch (UTF8Len(ch))
	{
	case 1:			// Single byte
		*cp++ = (UTF8)ch;
		return;

	case 2:		// 5 data bits in 1st byte, 6 in next
		*cp++ = 0xC0 | (UTF8)((ch >>  6) & 0x1F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;

	case 3:		// 4 data bits in 1st byte, 6 in each of 2 more
		*cp++ = 0xE0 | (UTF8)((ch >> 12) & 0x0F);
		*cp++ = 0x80 | (UTF8)((ch >>  6) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;

	case 4:		// 3 data bits in 1st byte, 6 in each of 3 more
		*cp++ = 0xF0 | (UTF8)((ch >> 18) & 0x07);
		*cp++ = 0x80 | (UTF8)((ch >> 12) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  6) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;
	}
}

#endif
