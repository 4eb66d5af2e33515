#include <docsift/assert_test.h>

#include "pdf_builder.hh"

#include <docsift/ContentTextLayer.hh>
#include <docsift/ImageStreamDecoder.hh>
#include <docsift/PdfExtractor.hh>
#include <docsift/ToUnicodeCMap.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

#include <iostream>

static std::shared_ptr<QPDFLogger>
capture_logger(std::string& warnings)
{
    auto logger = QPDFLogger::create();
    auto p = std::make_shared<Pl_String>("warnings", nullptr, warnings);
    logger->setWarn(p);
    logger->setInfo(logger->discard());
    return logger;
}

static std::vector<QPDFPageObjectHelper>
process(
    QPDF& pdf,
    std::string const& data,
    std::string& warnings,
    std::string const& description = "test.pdf")
{
    pdf.setLogger(capture_logger(warnings));
    pdf.processMemoryFile(description.c_str(), data.data(), data.size());
    return QPDFPageDocumentHelper(pdf).getAllPages();
}

static void
test_text_operators()
{
    auto data = make_text_pdf(
        {"BT /F1 12 Tf 72 700 Td (first) Tj 0 -14 Td (second) Tj 0 0 Td (same line) Tj ET\n"
         "BT 1 0 0 1 72 600 Tm (tm) Tj 1 0 0 1 100 600 Tm (also) Tj 1 0 0 1 72 580 Tm (next) Tj "
         "T* (star) Tj (quoted) ' 1 2 (dquoted) \" ET\n"
         "BT [(wide) -300 (gap) -50 (kern)] TJ ET\n"
         "BI /W 1 /H 1 /CS /G /BPC 8 ID \x80 EI\n"
         "BT (after image) Tj ET"});
    QPDF pdf;
    std::string warnings;
    auto pages = process(pdf, data, warnings);
    ContentTextLayer layer;
    auto items = layer.getTextItems(pages.at(0));
    std::vector<std::string> strs;
    std::vector<bool> eols;
    for (auto const& item: items) {
        strs.push_back(item.str);
        eols.push_back(item.hasEOL);
    }
    assert(
        strs ==
        (std::vector<std::string>{
            "first",
            "second",
            "same line",
            "tm",
            "also",
            "next",
            "star",
            "quoted",
            "dquoted",
            "wide gapkern",
            "after image"}));
    assert(
        eols ==
        (std::vector<bool>{
            true, false, true, false, true, true, true, true, true, true, true}));
    assert(
        PdfExtractor::joinTextItems(items) ==
        "first\nsecond same line\ntm also\nnext\nstar\nquoted\ndquoted\nwide gapkern\n"
        "after image");
}

static void
test_reconstruction()
{
    PdfBuilder b;
    int catalog = b.reserve();
    int pages = b.reserve();
    int content = b.addStream("", text_content({"recovered"}));
    int page = b.add(
        "<< /Type /Page /Parent " + std::to_string(pages) + " 0 R /Contents " +
        std::to_string(content) + " 0 R >>");
    b.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
    b.set(pages, "<< /Type /Pages /Kids [" + std::to_string(page) + " 0 R] /Count 1 >>");
    auto data = b.build(catalog, false, "", 7);

    QPDF pdf;
    std::string warnings;
    auto all_pages = process(pdf, data, warnings, "damaged.pdf");
    assert(all_pages.size() == 1);
    assert(warnings.find("damaged.pdf") != std::string::npos);
    ContentTextLayer layer;
    auto items = layer.getTextItems(all_pages.at(0));
    assert(items.size() == 1 && items.at(0).str == "recovered");
}

static void
test_inheritance()
{
    // Fonts come from resources inherited through the page tree.
    std::string cmap = "1 begincodespacerange <00> <FF> endcodespacerange\n"
                       "1 beginbfchar <41> <0416> endbfchar\n";
    PdfBuilder b;
    int catalog = b.reserve();
    int root_pages = b.reserve();
    int mid_pages = b.reserve();
    int to_unicode = b.addStream("", cmap);
    int font = b.add(
        "<< /Type /Font /Subtype /Type1 /BaseFont /Courier /ToUnicode " +
        std::to_string(to_unicode) + " 0 R >>");
    int c1 = b.addStream("", "BT /F9 10 Tf (A) Tj ET");
    int page = b.add(
        "<< /Type /Page /Parent " + std::to_string(mid_pages) + " 0 R /Contents " +
        std::to_string(c1) + " 0 R >>");
    b.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(root_pages) + " 0 R >>");
    b.set(
        root_pages,
        "<< /Type /Pages /Kids [" + std::to_string(mid_pages) +
            " 0 R] /Count 1 /MediaBox [0 0 300 400] /Resources << /Font << /F9 " +
            std::to_string(font) + " 0 R >> >> >>");
    b.set(
        mid_pages,
        "<< /Type /Pages /Parent " + std::to_string(root_pages) + " 0 R /Kids [" +
            std::to_string(page) + " 0 R] /Count 1 >>");

    QPDF pdf;
    std::string warnings;
    auto pages = process(pdf, b.build(catalog), warnings);
    assert(pages.size() == 1);
    ContentTextLayer layer;
    auto items = layer.getTextItems(pages.at(0));
    assert(items.size() == 1);
    // CYRILLIC CAPITAL LETTER ZHE
    assert(items.at(0).str == "\xd0\x96");
}

static void
test_content_stream_text()
{
    PdfBuilder b;
    int catalog = b.reserve();
    int pages = b.reserve();
    int flate = b.addFlateStream("", "BT (compressed) Tj ET");
    int hex = b.addStream("/Filter /ASCIIHexDecode", "425420286865782920546A204554>");
    int page = b.add(
        "<< /Type /Page /Parent " + std::to_string(pages) + " 0 R /Contents [" +
        std::to_string(flate) + " 0 R " + std::to_string(hex) + " 0 R] >>");
    b.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
    b.set(pages, "<< /Type /Pages /Kids [" + std::to_string(page) + " 0 R] /Count 1 >>");

    QPDF pdf;
    std::string warnings;
    auto all_pages = process(pdf, b.build(catalog), warnings);
    assert(PdfExtractor::getContentStreamText(all_pages.at(0)) == "compressed hex");
}

static void
test_to_unicode()
{
    std::string cmap = "/CIDInit /ProcSet findresource begin\n"
                       "begincmap\n"
                       "1 begincodespacerange <00> <FF> endcodespacerange\n"
                       "2 beginbfchar <01> <0048> <02> <0069> endbfchar\n"
                       "1 beginbfrange <10> <12> <0061> endbfrange\n"
                       "endcmap\n";
    PdfBuilder b;
    int catalog = b.reserve();
    int pages = b.reserve();
    int to_unicode = b.addStream("", cmap);
    int font = b.add(
        "<< /Type /Font /Subtype /Type1 /BaseFont /Custom /ToUnicode " +
        std::to_string(to_unicode) + " 0 R >>");
    int content = b.addStream(
        "", "BT /F1 12 Tf <0102> Tj 0 -14 Td [<10> -500 <1112>] TJ ET BT (plain) Tj ET");
    int page = b.add(
        "<< /Type /Page /Parent " + std::to_string(pages) + " 0 R /Resources << /Font << /F1 " +
        std::to_string(font) + " 0 R >> >> /Contents " + std::to_string(content) + " 0 R >>");
    b.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
    b.set(pages, "<< /Type /Pages /Kids [" + std::to_string(page) + " 0 R] /Count 1 >>");

    QPDF pdf;
    std::string warnings;
    auto all_pages = process(pdf, b.build(catalog), warnings);
    ContentTextLayer layer;
    auto items = layer.getTextItems(all_pages.at(0));
    assert(items.size() == 3);
    assert(items.at(0).str == "Hi");
    assert(items.at(0).hasEOL);
    assert(items.at(1).str == "a bc");
    assert(items.at(1).hasEOL);
    // Codes the CMap doesn't map are read as Latin-1.
    assert(items.at(2).str == "plain");

    ToUnicodeCMap narrow(cmap);
    assert(narrow.getCodeLength() == 1);
    assert(!narrow.empty());
    assert(narrow.decode("\x01\x12!") == "Hic!");

    ToUnicodeCMap wide("1 begincodespacerange <0000> <FFFF> endcodespacerange\n"
                       "1 beginbfchar <0101> <00E9> endbfchar\n"
                       "1 beginbfrange <0200> <0201> [<0041> <D83DDE00>] endbfrange\n");
    assert(wide.getCodeLength() == 2);
    // Unmapped two-byte codes are dropped.
    assert(wide.decode(std::string("\x01\x01\x02\x02", 4)) == "\xc3\xa9");
    assert(wide.decode(std::string("\x02\x00\x02\x01", 4)) == "A\xf0\x9f\x98\x80");
    assert(ToUnicodeCMap("no mappings here").empty());
    // Unreadable tokens are skipped.
    ToUnicodeCMap damaged("1 beginbfchar <01> <0041> ) <02> <0042> endbfchar");
    assert(damaged.decode("\x01\x02") == "AB");
}

static void
test_images()
{
    PdfBuilder b;
    int catalog = b.reserve();
    int pages = b.reserve();
    int img = b.addStream(
        "/Type /XObject /Subtype /Image /Width 1 /Height 1 /ColorSpace /DeviceGray "
        "/BitsPerComponent 8",
        std::string(1, '\x80'));
    int img2 = b.addStream(
        "/Type /XObject /Subtype /Image /Width 1 /Height 1 /ColorSpace /CS0 "
        "/BitsPerComponent 8",
        std::string(3, '\x40'));
    int form = b.reserve();
    b.setStream(
        form,
        "/Type /XObject /Subtype /Form /BBox [0 0 1 1] /Resources << /XObject << /Im0 " +
            std::to_string(img) + " 0 R /Self " + std::to_string(form) + " 0 R >> >>",
        "/Im0 Do");
    // A form with no resources of its own uses the page's.
    int bare_form = b.addStream(
        "/Type /XObject /Subtype /Form /BBox [0 0 1 1]", "/Im2 Do");
    int content = b.addStream("", "/Fm0 Do /Fm1 Do /Im1 Do");
    int page = b.add(
        "<< /Type /Page /Parent " + std::to_string(pages) +
        " 0 R /Resources << /ColorSpace << /CS0 /DeviceRGB >> /XObject << /Fm0 " +
        std::to_string(form) + " 0 R /Fm1 " + std::to_string(bare_form) + " 0 R /Im1 " +
        std::to_string(img) + " 0 R /Im2 " + std::to_string(img2) + " 0 R >> >> /Contents " +
        std::to_string(content) + " 0 R >>");
    b.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
    b.set(pages, "<< /Type /Pages /Kids [" + std::to_string(page) + " 0 R] /Count 1 >>");

    QPDF pdf;
    std::string warnings;
    auto all_pages = process(pdf, b.build(catalog), warnings);
    auto images = ImageStreamDecoder::findImages(all_pages.at(0));
    // The same image is reachable directly and through a form; it is returned once, from the
    // form, which is searched first. The form's reference to itself is not followed.
    assert(images.size() == 2);
    assert(images.at(0).name == "/Im0");
    assert(images.at(0).image.getObjGen().getObj() == img);
    assert(images.at(0).resources.getKey("/XObject").hasKey("/Self"));
    assert(images.at(1).name == "/Im2");
    assert(images.at(1).image.getObjGen().getObj() == img2);
    assert(images.at(1).resources.hasKey("/ColorSpace"));

    std::string info;
    auto logger = QPDFLogger::create();
    logger->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    ImageStreamDecoder decoder(logger);
    auto decoded = decoder.decode(images.at(1).image, images.at(1).resources, "image");
    assert(decoded && decoded->width == 1 && decoded->height == 1);
    assert(info.empty());
}

int
main()
{
    test_text_operators();
    test_reconstruction();
    test_inheritance();
    test_content_stream_text();
    test_to_unicode();
    test_images();
    std::cout << "end of pdf structure tests\n";
    return 0;
}
