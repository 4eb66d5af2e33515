#include <docsift/CsvExtractor.hh>

#include <docsift/SiftExc.hh>
#include <docsift/SiftUtil.hh>
#include <docsift/TextDecoder.hh>

namespace
{
    class RecordReader
    {
      public:
        RecordReader(char delimiter) :
            delimiter(delimiter)
        {
        }

        void
        handleChar(std::string const& text, size_t& pos)
        {
            char ch = text.at(pos);
            if (in_quotes) {
                if (ch == '"') {
                    if (pos + 1 < text.size() && text.at(pos + 1) == '"') {
                        field += '"';
                        ++pos;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field += ch;
                }
            } else if (ch == delimiter) {
                endField();
            } else if (ch == '\n' || ch == '\r') {
                if (ch == '\r' && pos + 1 < text.size() && text.at(pos + 1) == '\n') {
                    ++pos;
                }
                endRecord();
            } else if (ch == '"' && !quoted && SiftUtil::str_trim(field).empty()) {
                field.clear();
                in_quotes = true;
                quoted = true;
            } else if (!(quoted && (ch == ' ' || ch == '\t'))) {
                // Text after a closing quote is kept; white space there is dropped.
                field += ch;
            }
        }

        bool
        inQuotes() const
        {
            return in_quotes;
        }

        void
        endRecord()
        {
            bool blank = record.empty() && !quoted && SiftUtil::str_trim(field).empty();
            endField();
            if (blank) {
                record.clear();
            } else {
                records.push_back(std::move(record));
                record.clear();
            }
        }

        void
        finish()
        {
            if (!(record.empty() && field.empty() && !quoted)) {
                endRecord();
            }
        }

        std::vector<std::vector<std::string>> records;

      private:
        void
        endField()
        {
            record.push_back(quoted ? field : SiftUtil::str_trim(field));
            field.clear();
            quoted = false;
        }

        char delimiter;
        std::string field;
        std::vector<std::string> record;
        bool in_quotes{false};
        bool quoted{false};
    };
} // namespace

std::string
CsvExtractor::getName() const
{
    return "CsvExtractor";
}

bool
CsvExtractor::supports(std::string const& media_type) const
{
    return media_type == "text/csv" || media_type == "text/tab-separated-values" ||
        media_type == "application/csv";
}

std::vector<std::vector<std::string>>
CsvExtractor::parseRecords(std::string const& text, char delimiter, std::string const& file_name)
{
    RecordReader reader(delimiter);
    for (size_t pos = 0; pos < text.size(); ++pos) {
        reader.handleChar(text, pos);
    }
    if (reader.inQuotes()) {
        throw SiftExc(
            docsift_e_unsupported, file_name, "", 0, "CSV data ends inside a quoted field");
    }
    reader.finish();
    return reader.records;
}

std::string
CsvExtractor::toMarkdown(std::vector<std::vector<std::string>> const& records)
{
    auto row = [](std::vector<std::string> const& fields) {
        std::string result = "|";
        for (auto const& field: fields) {
            result += " " + field + " |";
        }
        if (fields.empty()) {
            result += " |";
        }
        return result;
    };
    if (records.empty()) {
        return "";
    }
    std::string result = row(records.front());
    result += "\n" + row(std::vector<std::string>(records.front().size(), "---"));
    for (size_t i = 1; i < records.size(); ++i) {
        result += "\n" + row(records.at(i));
    }
    return result;
}

ExtractedDocument
CsvExtractor::extract(std::string const& data, std::string const& file_name)
{
    auto text = TextDecoder::decode(data);
    char delimiter = text.find('\t') != std::string::npos ? '\t' : ',';
    auto records = parseRecords(text, delimiter, file_name);

    auto doc = ExtractedDocument::create(file_name, "text/csv");
    if (!records.empty()) {
        doc.chunks.emplace_back(dc_table, toMarkdown(records));
    }
    doc.metadata.addDictionaryMember(
        "rowCount", JSON::makeInt(static_cast<long long>(records.size())));
    doc.metadata.addDictionaryMember(
        "columnCount",
        JSON::makeInt(records.empty() ? 0 : static_cast<long long>(records.front().size())));
    doc.metadata.addDictionaryMember("delimiter", JSON::makeString(std::string(1, delimiter)));
    return doc;
}
