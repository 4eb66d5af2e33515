#include <cstdlib>
#include <cstring>
#include <iostream>

#include <docsift/ContentTextLayer.hh>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QUtil.hh>

static char const* whoami = nullptr;

void
usage()
{
    std::cerr << "Usage: " << whoami << " filename\n"
              << "Prints the raw text layer of each page of filename\n";
    exit(2);
}

int
main(int argc, char* argv[])
{
    whoami = QUtil::getWhoami(argv[0]);

    if ((argc == 2) && (strcmp(argv[1], "--version") == 0)) {
        std::cout << whoami << " version 1.0\n";
        exit(0);
    }

    if (argc != 2) {
        usage();
    }
    char const* filename = argv[1];

    try {
        QPDF pdf;
        pdf.processFile(filename);
        ContentTextLayer text_layer;
        int pageno = 0;
        for (auto& page: QPDFPageDocumentHelper(pdf).getAllPages()) {
            ++pageno;
            std::cout << "--- page " << pageno << " ---\n";
            for (auto const& item: text_layer.getTextItems(page)) {
                std::cout << item.str << (item.hasEOL ? "\n" : "");
            }
            std::cout << '\n';
        }
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << '\n';
        exit(2);
    }

    return 0;
}
