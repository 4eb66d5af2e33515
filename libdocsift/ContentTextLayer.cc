#include <docsift/ContentTextLayer.hh>

#include <docsift/TextDecoder.hh>
#include <docsift/ToUnicodeCMap.hh>

#include <qpdf/QPDFObjectHandle.hh>

#include <map>
#include <memory>

namespace
{
    // A TJ adjustment more negative than this, in thousandths of a text space unit, is a word
    // gap.
    double const space_threshold = -200.0;

    class TextCollector: public QPDFObjectHandle::ParserCallbacks
    {
      public:
        TextCollector(QPDFObjectHandle resources) :
            fonts(resources.isDictionary() ? resources.getKey("/Font") : resources)
        {
        }
        ~TextCollector() override = default;

        void
        handleObject(QPDFObjectHandle obj) override
        {
            if (!obj.isOperator()) {
                operands.push_back(obj);
                return;
            }
            handleOperator(obj.getOperatorValue());
            operands.clear();
        }

        void
        handleEOF() override
        {
        }

        std::vector<TextItem>
        getItems() const
        {
            return items;
        }

      private:
        // The last operand as a number, or 0
        double
        lastNumber()
        {
            double value = 0.0;
            if (!operands.empty()) {
                operands.back().getValueAsNumber(value);
            }
            return value;
        }

        void
        handleOperator(std::string const& op)
        {
            auto n = operands.size();
            if (op == "BT") {
                have_tm = false;
            } else if (op == "ET") {
                markEOL();
            } else if (op == "Tf" && n >= 2) {
                std::string name;
                if (operands.at(n - 2).getValueAsName(name)) {
                    selectFont(name);
                }
            } else if ((op == "Td" || op == "TD") && n >= 2) {
                if (lastNumber() != 0.0) {
                    markEOL();
                }
            } else if (op == "T*") {
                markEOL();
            } else if (op == "Tm" && n >= 6) {
                double y = lastNumber();
                if (have_tm && y != last_tm_y) {
                    markEOL();
                }
                have_tm = true;
                last_tm_y = y;
            } else if (op == "Tj" && n >= 1) {
                show(operands.at(n - 1));
            } else if ((op == "'" || op == "\"") && n >= 1) {
                markEOL();
                show(operands.at(n - 1));
            } else if (op == "TJ" && n >= 1 && operands.at(n - 1).isArray()) {
                std::string text;
                for (auto& item: operands.at(n - 1).getArrayAsVector()) {
                    std::string str;
                    double adjustment = 0.0;
                    if (item.getValueAsString(str)) {
                        text += decode(str);
                    } else if (item.getValueAsNumber(adjustment) && adjustment < space_threshold) {
                        text += " ";
                    }
                }
                add(text);
            }
        }

        void
        markEOL()
        {
            if (!items.empty()) {
                items.back().hasEOL = true;
            }
        }

        void
        show(QPDFObjectHandle str)
        {
            std::string bytes;
            if (str.getValueAsString(bytes)) {
                add(decode(bytes));
            }
        }

        void
        add(std::string const& text)
        {
            if (!text.empty()) {
                items.push_back({text, false});
            }
        }

        void
        selectFont(std::string const& name)
        {
            auto iter = cmaps.find(name);
            if (iter == cmaps.end()) {
                std::shared_ptr<ToUnicodeCMap> cmap;
                auto font = fonts.isDictionary() ? fonts.getKey(name) : fonts;
                auto to_unicode = font.isDictionary() ? font.getKey("/ToUnicode") : font;
                if (to_unicode.isStream()) {
                    auto data = to_unicode.getStreamData();
                    cmap = std::make_shared<ToUnicodeCMap>(std::string(
                        reinterpret_cast<char const*>(data->getBuffer()), data->getSize()));
                    if (cmap->empty()) {
                        cmap = nullptr;
                    }
                }
                iter = cmaps.insert({name, cmap}).first;
            }
            current = iter->second;
        }

        std::string
        decode(std::string const& bytes)
        {
            return current ? current->decode(bytes) : TextDecoder::decode(bytes);
        }

        QPDFObjectHandle fonts;
        std::vector<QPDFObjectHandle> operands;
        std::map<std::string, std::shared_ptr<ToUnicodeCMap>> cmaps;
        std::shared_ptr<ToUnicodeCMap> current;
        std::vector<TextItem> items;
        bool have_tm{false};
        double last_tm_y{0.0};
    };
} // namespace

std::vector<TextItem>
ContentTextLayer::getTextItems(QPDFPageObjectHelper& page)
{
    TextCollector collector(page.getAttribute("/Resources", false));
    page.parseContents(&collector);
    return collector.getItems();
}
