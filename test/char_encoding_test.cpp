/*
 * Test program for the UTF-8 encoding and character classification.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<cstdio>
#include	<cstring>
#include	<char_encoding.h>

#include	"expect.h"

void		utf8_char_sizes();
void		utf8_decode();
void		utf8_invalid();
void		utf8_full_char();
void		utf8_put();
void		ucs4_white();

UCS4		max_1byte = (0x1<<7)-1;				// 0x7F
UCS4		max_2byte = (0x1<<11)-1;			// 0x7FF
UCS4		max_3byte = (0x1<<16)-1;			// 0xFFFF
UCS4		max_4byte = UCS4_MAX;				// 0x10FFFF

int
main(int argc, const char** argv)
{
	if (argc > 1 && 0 == strcmp("-p", argv[1]))
		show_passes = true;

	utf8_char_sizes();	// Test the different encoded character lengths
	utf8_decode();		// Test decoding of each length at its limits
	utf8_invalid();		// Test overlong, surrogate, out-of-range and stray bytes
	utf8_full_char();	// Test truncated sequences at the end of a buffer
	utf8_put();
	ucs4_white();

	return test_summary();
}

// Decode a NUL-terminated string, checking the character and the width
static void
expect_decode(const char* when, const UTF8* s, UCS4 wanted, int wanted_width)
{
	char		msg[200];
	int		width;
	UCS4		ch = UTF8Decode(s, s+strlen(s), width);

	snprintf(msg, sizeof(msg), "%s decodes", when);
	expect(msg, ch, wanted);
	snprintf(msg, sizeof(msg), "%s width", when);
	expect(msg, width, wanted_width);
}

void
utf8_char_sizes()
{
	test_group("encoded size for UCS4 chars");

	expect("max length 1", UTF8Len(max_1byte), 1);

	expect("min length 2", UTF8Len(max_1byte+1), 2);
	expect("max length 2", UTF8Len(max_2byte), 2);

	expect("min length 3", UTF8Len(max_2byte+1), 3);
	expect("max length 3", UTF8Len(max_3byte), 3);

	expect("min length 4", UTF8Len(max_3byte+1), 4);
	expect("max length 4", UTF8Len(max_4byte), 4);

	// Values that can't be encoded are written as the replacement character
	expect("beyond Unicode", UTF8Len(max_4byte+1), 3);
	expect("far beyond Unicode", UTF8Len(0x80000000), 3);

	test_group("UTF8 lead and trailing bytes");

	expect("ASCII lead", UTF8CorrectLen('\x7F'), 1);
	expect("stray trailing byte", UTF8CorrectLen('\x80'), 0);
	expect("overlong lead C0", UTF8CorrectLen('\xC0'), 0);
	expect("overlong lead C1", UTF8CorrectLen('\xC1'), 0);
	expect("minimum 1st-of-two", UTF8CorrectLen('\xC2'), 2);
	expect("maximum 1st-of-two", UTF8CorrectLen('\xDF'), 2);
	expect("minimum 1st-of-three", UTF8CorrectLen('\xE0'), 3);
	expect("maximum 1st-of-three", UTF8CorrectLen('\xEF'), 3);
	expect("minimum 1st-of-four", UTF8CorrectLen('\xF0'), 4);
	expect("maximum 1st-of-four", UTF8CorrectLen('\xF4'), 4);
	expect("beyond 1st-of-four", UTF8CorrectLen('\xF5'), 0);
	expect("never legal", UTF8CorrectLen('\xFF'), 0);
	expect("maximum 2nd-of-two", UTF8Is2nd('\xBF'), 1);	// \xBF = '\x80'+'\x3F'
	expect("not a 2nd", UTF8Is2nd('\xC0'), 0);

	expect("E0 second byte floor", UTF8LeadOf('\xE0').lo, 0xA0);
	expect("ED second byte ceiling", UTF8LeadOf('\xED').hi, 0x9F);
	expect("F0 second byte floor", UTF8LeadOf('\xF0').lo, 0x90);
	expect("F4 second byte ceiling", UTF8LeadOf('\xF4').hi, 0x8F);
}

void
utf8_decode()
{
	test_group("decoding UTF8 to UCS4");

	int		width;
	const UTF8	nul[] = { '\0' };
	expect("NUL decodes", UTF8Decode(nul, nul+1, width), 0);
	expect("NUL width", width, 1);

	expect_decode("one char", "A", 'A', 1);
	expect_decode("max one char", "\x7F", max_1byte, 1);
	expect_decode("min two char", "\xC2\x80", max_1byte+1, 2);
	expect_decode("max two char", "\xDF\xBF", max_2byte, 2);
	expect_decode("min three char", "\xE0\xA0\x80", max_2byte+1, 3);
	expect_decode("last before surrogates", "\xED\x9F\xBF", 0xD7FF, 3);
	expect_decode("first after surrogates", "\xEE\x80\x80", 0xE000, 3);
	expect_decode("max three char", "\xEF\xBF\xBF", max_3byte, 3);
	expect_decode("min four char", "\xF0\x90\x80\x80", max_3byte+1, 4);
	expect_decode("max four char", "\xF4\x8F\xBF\xBF", max_4byte, 4);
	expect_decode("replacement itself", UCS4_NO_GLYPH, UCS4_REPLACEMENT, 3);
	expect_decode("only the first of two", "\xC3\xA9" "A", 0xE9, 2);

	expect("empty decodes", UTF8Decode(nul, nul, width), UCS4_REPLACEMENT);
	expect("empty width", width, 0);
}

void
utf8_invalid()
{
	test_group("Invalid UTF8 encoding");

	// Each illegal sequence consumes just one byte
	expect_decode("overlong two", "\xC0\x80", UCS4_REPLACEMENT, 1);
	expect_decode("overlong two C1", "\xC1\xBF", UCS4_REPLACEMENT, 1);
	expect_decode("overlong three", "\xE0\x9F\xBF", UCS4_REPLACEMENT, 1);
	expect_decode("overlong four", "\xF0\x8F\xBF\xBF", UCS4_REPLACEMENT, 1);
	expect_decode("min surrogate", "\xED\xA0\x80", UCS4_REPLACEMENT, 1);
	expect_decode("max surrogate", "\xED\xBF\xBF", UCS4_REPLACEMENT, 1);
	expect_decode("beyond Unicode", "\xF4\x90\x80\x80", UCS4_REPLACEMENT, 1);
	expect_decode("lead F5", "\xF5\x80\x80\x80", UCS4_REPLACEMENT, 1);
	expect_decode("old six byte lead", "\xFC\xBF\xBF\xBF\xBF\xBF", UCS4_REPLACEMENT, 1);

	expect_decode("stray 1st of 2", "\xC2\x01", UCS4_REPLACEMENT, 1);
	expect_decode("stray 1st of 3", "\xE1\xBF\x01", UCS4_REPLACEMENT, 1);
	expect_decode("stray 1st of 4", "\xF1\xBF\xBF\x01", UCS4_REPLACEMENT, 1);
	expect_decode("stray min trailing byte", "\x80", UCS4_REPLACEMENT, 1);
	expect_decode("stray max trailing byte", "\xBF", UCS4_REPLACEMENT, 1);
	expect_decode("truncated two", "\xC3", UCS4_REPLACEMENT, 1);
	expect_decode("truncated four", "\xF0\x9F\x98", UCS4_REPLACEMENT, 1);
}

void
utf8_full_char()
{
	test_group("Complete characters at the end of a buffer");

	const UTF8*	s;

	s = "";
	expect("empty is not full", UTF8FullChar(s, s), false);
	s = "A";
	expect("ASCII is full", UTF8FullChar(s, s+1), true);
	s = "\xC3\xA9";
	expect("half of two is not full", UTF8FullChar(s, s+1), false);
	expect("two of two is full", UTF8FullChar(s, s+2), true);
	s = "\xE2\x88\x82";
	expect("one of three is not full", UTF8FullChar(s, s+1), false);
	expect("two of three is not full", UTF8FullChar(s, s+2), false);
	expect("three of three is full", UTF8FullChar(s, s+3), true);
	s = "\xF0\x90\x8C\x8F";
	expect("three of four is not full", UTF8FullChar(s, s+3), false);
	expect("four of four is full", UTF8FullChar(s, s+4), true);

	// Known to be illegal already, so no more bytes can change the result
	s = "\x80";
	expect("stray trailing byte is full", UTF8FullChar(s, s+1), true);
	s = "\xC0";
	expect("overlong lead is full", UTF8FullChar(s, s+1), true);
	s = "\xE0\x80";
	expect("overlong three prefix is full", UTF8FullChar(s, s+2), true);
	s = "\xED\xA0";
	expect("surrogate prefix is full", UTF8FullChar(s, s+2), true);
	s = "\xF4\x90";
	expect("beyond Unicode prefix is full", UTF8FullChar(s, s+2), true);
	s = "\xF0\x90\x41";
	expect("bad third of four is full", UTF8FullChar(s, s+3), true);
	s = "\xCC";
	expect("combining lead alone is not full", UTF8FullChar(s, s+1), false);
}

// Encode ch, and expect the given bytes
static void
expect_put(const char* when, UCS4 ch, const char* wanted)
{
	UTF8		buf[UTF8_MAX+1];
	UTF8*		cp = buf;
	char		msg[200];

	UTF8Put(cp, ch);
	snprintf(msg, sizeof(msg), "%s length", when);
	expect(msg, cp-buf, strlen(wanted));
	snprintf(msg, sizeof(msg), "%s matches UTF8Len", when);
	expect(msg, cp-buf, UTF8Len(ch));
	snprintf(msg, sizeof(msg), "%s bytes", when);
	expect(msg, 0 == memcmp(buf, wanted, cp-buf));
}

void
utf8_put()
{
	test_group("encoding UCS4 to UTF8");

	expect_put("ASCII", 'A', "A");
	expect_put("e acute", 0xE9, "\xC3\xA9");
	expect_put("partial differential", 0x2202, "\xE2\x88\x82");
	expect_put("gothic letter", 0x1030F, "\xF0\x90\x8C\x8F");
	expect_put("max Unicode", UCS4_MAX, "\xF4\x8F\xBF\xBF");
	expect_put("surrogate", 0xD800, UCS4_NO_GLYPH);
	expect_put("beyond Unicode", UCS4_MAX+1, UCS4_NO_GLYPH);
	expect_put("none", UCS4_NONE, UCS4_NO_GLYPH);
}

void
ucs4_white()
{
	test_group("UCS4 white space");

	expect("tab", UCS4IsWhite('\t'));
	expect("newline", UCS4IsWhite('\n'));
	expect("vertical tab", UCS4IsWhite('\v'));
	expect("form feed", UCS4IsWhite('\f'));
	expect("return", UCS4IsWhite('\r'));
	expect("space", UCS4IsWhite(' '));
	expect("NEL", UCS4IsWhite(0x85));
	expect("no-break space", UCS4IsWhite(0xA0));
	expect("em space", UCS4IsWhite(0x2003));
	expect("line separator", UCS4IsWhite(0x2028));
	expect("ideographic space", UCS4IsWhite(0x3000));

	expect("!backspace", !UCS4IsWhite('\b'));
	expect("!shift out", !UCS4IsWhite(0x0E));
	expect("!letter", !UCS4IsWhite('a'));
	expect("!zero width space", !UCS4IsWhite(0x200B));
	expect("!replacement", !UCS4IsWhite(UCS4_REPLACEMENT));
}
