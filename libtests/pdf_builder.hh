#ifndef PDF_BUILDER_HH
#define PDF_BUILDER_HH

// Assembles small PDF files in memory for tests. Objects are numbered from 1 in the order they
// are reserved; build() writes them with a correct cross-reference table or stream.

#include <qpdf/Pl_Flate.hh>
#include <qpdf/Pl_String.hh>

#include <cstdio>
#include <map>
#include <string>
#include <vector>

class PdfBuilder
{
  public:
    // Reserve an object number to be filled in later with set or setStream.
    int
    reserve()
    {
        bodies.emplace_back();
        return static_cast<int>(bodies.size());
    }

    // body is everything between "N 0 obj" and "endobj".
    int
    add(std::string const& body)
    {
        int objid = reserve();
        set(objid, body);
        return objid;
    }

    void
    set(int objid, std::string const& body)
    {
        bodies.at(static_cast<size_t>(objid - 1)) = body;
    }

    // dict_entries is the inside of the stream dictionary without /Length.
    int
    addStream(std::string const& dict_entries, std::string const& data)
    {
        int objid = reserve();
        setStream(objid, dict_entries, data);
        return objid;
    }

    void
    setStream(int objid, std::string const& dict_entries, std::string const& data)
    {
        set(objid,
            "<< " + dict_entries + " /Length " + std::to_string(data.size()) + " >>\nstream\n" +
                data + "\nendstream");
    }

    int
    addFlateStream(std::string const& dict_entries, std::string const& data)
    {
        return addStream(dict_entries + " /Filter /FlateDecode", deflate(data));
    }

    // Write the file. With xref_stream, the cross-reference data is written as an uncompressed
    // cross-reference stream instead of a table. trailer_extra is added to the trailer
    // dictionary. If startxref_delta is not zero, it is added to the startxref offset to damage
    // the file.
    std::string
    build(
        int root,
        bool xref_stream = false,
        std::string const& trailer_extra = "",
        long startxref_delta = 0) const
    {
        std::string out = "%PDF-" + version + "\n%\xbf\xf7\xa2\xfe\n";
        std::vector<size_t> offsets;
        for (size_t i = 0; i < bodies.size(); ++i) {
            offsets.push_back(out.size());
            out += std::to_string(i + 1) + " 0 obj\n" + bodies.at(i) + "\nendobj\n";
        }
        size_t xref_offset = out.size();
        auto size = std::to_string(bodies.size() + (xref_stream ? 2 : 1));
        if (xref_stream) {
            // Entries: type (1 byte), offset (4 bytes), generation (1 byte)
            std::string data;
            auto entry = [&data](int type, size_t offset, int gen) {
                data += static_cast<char>(type);
                for (int shift = 24; shift >= 0; shift -= 8) {
                    data += static_cast<char>((offset >> shift) & 0xff);
                }
                data += static_cast<char>(gen);
            };
            entry(0, 0, 255);
            for (auto offset: offsets) {
                entry(1, offset, 0);
            }
            entry(1, xref_offset, 0);
            out += std::to_string(bodies.size() + 1) + " 0 obj\n<< /Type /XRef /Size " + size +
                " /W [1 4 1] /Root " + std::to_string(root) + " 0 R " + trailer_extra +
                " /Length " + std::to_string(data.size()) + " >>\nstream\n" + data +
                "\nendstream\nendobj\n";
        } else {
            out += "xref\n0 " + size + "\n0000000000 65535 f \n";
            for (auto offset: offsets) {
                char buf[32];
                snprintf(buf, sizeof(buf), "%010zu 00000 n \n", offset);
                out += buf;
            }
            out += "trailer << /Size " + size + " /Root " + std::to_string(root) + " 0 R " +
                trailer_extra + " >>\n";
        }
        out += "startxref\n" + std::to_string(static_cast<long>(xref_offset) + startxref_delta) +
            "\n%%EOF\n";
        return out;
    }

    static std::string
    deflate(std::string const& data)
    {
        std::string result;
        Pl_String out("deflated", nullptr, result);
        Pl_Flate flate("deflate", &out, Pl_Flate::a_deflate);
        flate.writeString(data);
        flate.finish();
        return result;
    }

    std::string version{"1.7"};

  private:
    std::vector<std::string> bodies;
};

// Build a document with one page per entry of contents. Each page gets resources containing
// /Font << /F1 ... >> plus resource_extra, which is inserted into every page's resource
// dictionary as is.
static inline std::string
make_text_pdf(
    std::vector<std::string> const& contents,
    std::string const& resource_extra = "",
    bool xref_stream = false)
{
    PdfBuilder b;
    int catalog = b.reserve();
    int pages = b.reserve();
    int font = b.add("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");
    std::string kids;
    for (auto const& content: contents) {
        int stream = b.addStream("", content);
        int page = b.add(
            "<< /Type /Page /Parent " + std::to_string(pages) +
            " 0 R /MediaBox [0 0 612 792] /Resources << /Font << /F1 " + std::to_string(font) +
            " 0 R >> " + resource_extra + " >> /Contents " + std::to_string(stream) + " 0 R >>");
        kids += std::to_string(page) + " 0 R ";
    }
    b.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
    b.set(
        pages,
        "<< /Type /Pages /Kids [ " + kids + "] /Count " + std::to_string(contents.size()) + " >>");
    return b.build(catalog, xref_stream);
}

// A content stream that shows each line in its own text object
static inline std::string
text_content(std::vector<std::string> const& lines)
{
    std::string result;
    int y = 700;
    for (auto const& line: lines) {
        result += "BT /F1 12 Tf 72 " + std::to_string(y) + " Td (" + line + ") Tj ET\n";
        y -= 14;
    }
    return result;
}

#endif // PDF_BUILDER_HH
