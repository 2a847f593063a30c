/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4251)
#endif

#include <string>
#include <stdexcept>
#include <smtpuri/config.hpp>


namespace smtpuri
{


/**
Base class for codecs, contains various constants and miscellaneous functions for encoding/decoding purposes.
**/
class SMTPURI_EXPORT codec
{
public:

    /**
    Calculating value of the given hex digit.

    @param digit Hex digit, either case.
    @return      Value in range 0-15.
    **/
    static constexpr int hex_digit_to_int(char digit)
    {
        if (digit >= ZERO_CHAR && digit <= NINE_CHAR)
            return digit - ZERO_CHAR;
        if (digit >= 'a' && digit <= 'f')
            return digit - 'a' + 10;
        return digit - A_CHAR + 10;
    }

    /**
    Upper case hex digit of the given value.
    **/
    static constexpr char int_to_hex_digit(int value)
    {
        return HEX_DIGITS[value & 0x0F];
    }

    /**
    Zero character.
    **/
    static constexpr char ZERO_CHAR = '0';

    /**
    Nine character.
    **/
    static constexpr char NINE_CHAR = '9';

    /**
    Character `A`.
    **/
    static constexpr char A_CHAR = 'A';

    /**
    Plus character.
    **/
    static constexpr char PLUS_CHAR = '+';

    /**
    Space character.
    **/
    static constexpr char SPACE_CHAR = ' ';

    /**
    Percent character.
    **/
    static constexpr char PERCENT_HEX_FLAG = '%';

    /**
    Hexadecimal alphabet.
    **/
    static constexpr const char* HEX_DIGITS = "0123456789ABCDEF";
};


/**
Error thrown by codecs.
**/
class codec_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor.

    @param msg Error message.
    **/
    explicit codec_error(const std::string& msg) : std::runtime_error(msg)
    {
    }

    /**
    Calling parent constructor.

    @param msg Error message.
    **/
    explicit codec_error(const char* msg) : std::runtime_error(msg)
    {
    }
};


} // namespace smtpuri


#ifdef _MSC_VER
#pragma warning(pop)
#endif
