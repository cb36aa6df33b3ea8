#if !defined(ERROR_H)
#define	ERROR_H
/*
 * Error numbering system.
 *
 * Each subsystem is statically allocated a 16-bit subsystem "set" number.
 * Each set contains up to 16384 messages indicated by a 14-bit code.
 * The set number 0 corresponds to the system errno, and the msg codes are the errno codes.
 *
 * For compliance with the Microsoft error scheme, the high-order (sign) bit is always set.
 * Because Microsoft subsystems also avoid using the second-top bit (they call it CUST),
 * this bit is always set, to keep clear of collisions with Microsoft subsystems.
 * The zero ErrNum means "no error".
 *
 * An Error pairs an ErrNum with its default (untranslated) message text. It is
 * a small value, copied freely and never allocating, so code that must not
 * allocate can still carry errors. Two Errors are the same error when their
 * ErrNums are equal; the text is only for display.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stdint.h>

class ErrNum
{
public:
	static const int32_t	ERR_FLAG = INT32_MIN;	// Sign bit is used to indicate an error, allowing quick checks
	static const int32_t	ERR_CUST = 0x40000000;	// Including this bit guarantees no collision with Microsoft subsystem codes

	constexpr ErrNum()
			: errnum(0) {}
	constexpr ErrNum(int set, int msg)
			: errnum(ERR_FLAG | ERR_CUST | ((set & 0xFFFF) << 14) | (msg & 0x3FFF)) {}
	constexpr int	set() const
			{ return (errnum >> 14) & 0xFFFF; }
	constexpr int	msg() const
			{ return errnum & 0x3FFF; }
	constexpr bool	isError() const
			{ return errnum != 0; }
	bool		operator==(ErrNum x) const
			{ return errnum == x.errnum; }
	bool		operator!=(ErrNum x) const
			{ return errnum != x.errnum; }
	constexpr operator int32_t() const		// Allows use in switch statements
			{ return errnum; }
private:
	int32_t		errnum;
};

class	Error
{
public:
	constexpr Error()
			: num(), def_text(0) {}
	constexpr Error(ErrNum n, const char* d = 0)
			: num(n), def_text(d) {}

	ErrNum		errorNum() const
			{ return num; }
	const char*	default_text() const
			{ return def_text ? def_text : ""; }
	bool		isError() const
			{ return num.isError(); }
	operator int32_t() const			// Test or switch on the error number
			{ return num; }

	bool		operator==(const Error& e) const
			{ return num == e.num; }
	bool		operator!=(const Error& e) const
			{ return num != e.num; }
	bool		operator==(ErrNum n) const
			{ return num == n; }
	bool		operator!=(ErrNum n) const
			{ return num != n; }

private:
	ErrNum		num;
	const char*	def_text;
};

#endif
