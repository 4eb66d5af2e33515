#ifndef TOUNICODECMAP_HH
#define TOUNICODECMAP_HH

#include <map>
#include <string>

// The character code to Unicode mapping of a font's /ToUnicode stream. Only the bfchar and
// bfrange sections are used.
class ToUnicodeCMap
{
  public:
    // Parse CMap program text. Tokens that can't be read are skipped.
    ToUnicodeCMap(std::string const& data);

    // Number of bytes per character code, 1 or 2
    size_t
    getCodeLength() const
    {
        return code_length;
    }
    bool
    empty() const
    {
        return mappings.empty();
    }

    // Convert a string shown with this font to UTF-8. Codes with no mapping are dropped, except
    // that single-byte codes fall back to their Latin-1 value.
    std::string decode(std::string const& bytes) const;

  private:
    void addRange(std::string const& lo, std::string const& hi, std::string const& dst);

    size_t code_length{0};
    // raw code bytes -> UTF-16BE
    std::map<std::string, std::string> mappings;
};

#endif // TOUNICODECMAP_HH
