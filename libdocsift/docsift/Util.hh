#ifndef UTIL_HH
#define UTIL_HH

// Character classes of content stream syntax, for the lexer.
namespace docsift::util
{
    // The value of a hex digit, or '\20' if digit is not one.
    inline constexpr char
    hex_decode_char(char digit)
    {
        return digit <= '9' && digit >= '0'
            ? char(digit - '0')
            : (digit >= 'a' && digit <= 'f'
                   ? char(digit - 'a' + 10)
                   : (digit >= 'A' && digit <= 'F' ? char(digit - 'A' + 10) : '\20'));
    }

    inline constexpr bool
    is_hex_digit(char ch)
    {
        return hex_decode_char(ch) < '\20';
    }

    // PDF white space includes the null character.
    inline constexpr bool
    is_pdf_space(char ch)
    {
        return ch == '\0' || ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t' || ch == '\f';
    }

    inline constexpr bool
    is_delimiter(char ch)
    {
        return is_pdf_space(ch) || ch == '/' || ch == '(' || ch == ')' || ch == '{' || ch == '}' ||
            ch == '<' || ch == '>' || ch == '[' || ch == ']' || ch == '%';
    }

    inline constexpr bool
    is_alpha(char ch)
    {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
    }

    inline constexpr bool
    is_octal_digit(char ch)
    {
        return ch >= '0' && ch <= '7';
    }
} // namespace docsift::util

#endif // UTIL_HH
