/*
 * Some generally useful Rewriters.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<rewriters.h>

void
CopyRewriter::rewrite(RewriteState& state)
{
	state.writeChar(state.readChar());
}

void
ReplaceRewriter::rewrite(RewriteState& state)
{
	(void)state.readChar();
	state.writeChar(filler);
}

void
CleanSpaces::rewrite(RewriteState& state)
{
	UCS4	ch = state.readChar();

	if (UCS4IsWhite(ch))
	{
		found_space = true;
		return;
	}

	// If either write fails the segment is discarded, so leave our state as it was
	if (found_space && not_first && !state.writeChar(' '))
		return;
	if (!state.writeChar(ch))
		return;
	found_space = false;
	not_first = true;
}

void
EscapeRewriter::rewrite(RewriteState& state)
{
	UCS4	ch = state.readChar();

	if (ch >= 0xFFFF)
		state.writef("\\U%08X", (unsigned)ch);
	else if (!UCS4IsASCII(ch))
		state.writef("\\u%04X", (unsigned)ch);
	else if (ch == '\\')
		state.writeString("\\\\");
	else
		state.writeChar(ch);
}

static int
upper_hex_digit(UCS4 ch)
{
	if (ch >= '0' && ch <= '9')
		return ch-'0';
	if (ch >= 'A' && ch <= 'F')
		return ch-'A'+10;
	return -1;
}

void
UnescapeRewriter::rewrite(RewriteState& state)
{
	UCS4	ch = state.readChar();

	if (ch != '\\')
	{
		state.writeChar(ch);
		return;
	}

	int	digits;
	switch (state.readChar())
	{
	case 'u':
		digits = 4;
		break;

	case 'U':
		digits = 8;
		break;

	case '\\':
		state.writeChar('\\');
		return;

	default:
		state.writeChar(UCS4_REPLACEMENT);
		return;
	}

	UCS4	value = 0;
	for (int i = 0; i < digits; i++)
	{
		int	digit = upper_hex_digit(state.readChar());
		if (digit < 0)
		{
			state.unreadChar();
			state.writeChar(UCS4_REPLACEMENT);
			return;
		}
		value = (value << 4) | digit;
	}
	state.writeChar(value);
}
