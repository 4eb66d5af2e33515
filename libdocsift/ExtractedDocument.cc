#include <docsift/ExtractedDocument.hh>

#include <docsift/SiftUtil.hh>

#include <stdexcept>

ContentChunk::ContentChunk(
    docsift_chunk_type_e type,
    std::string const& text,
    std::optional<int> page,
    std::optional<std::string> section) :
    type(type),
    text(text),
    page(page),
    section(section)
{
}

char const*
ContentChunk::typeName(docsift_chunk_type_e type)
{
    switch (type) {
    case dc_heading:
        return "heading";
    case dc_paragraph:
        return "paragraph";
    case dc_table:
        return "table";
    case dc_list:
        return "list";
    case dc_image:
        return "image";
    }
    throw std::logic_error("ContentChunk::typeName called with unknown chunk type");
}

JSON
ContentChunk::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("id", JSON::makeString(id));
    j.addDictionaryMember("type", JSON::makeString(typeName(type)));
    j.addDictionaryMember("text", JSON::makeString(text));
    if (page) {
        j.addDictionaryMember("page", JSON::makeInt(*page));
    }
    if (section) {
        j.addDictionaryMember("section", JSON::makeString(*section));
    }
    return j;
}

ExtractedDocument
ExtractedDocument::create(std::string const& file_name, std::string const& mime_type)
{
    ExtractedDocument doc;
    doc.documentId = SiftUtil::random_uuid();
    doc.fileName = file_name;
    doc.mimeType = mime_type;
    return doc;
}

JSON
ExtractedDocument::getJSON() const
{
    auto j = JSON::makeDictionary();
    j.addDictionaryMember("documentId", JSON::makeString(documentId));
    j.addDictionaryMember("fileName", JSON::makeString(fileName));
    j.addDictionaryMember("mimeType", JSON::makeString(mimeType));
    j.addDictionaryMember("metadata", metadata);
    auto j_chunks = j.addDictionaryMember("chunks", JSON::makeArray());
    for (auto const& chunk: chunks) {
        j_chunks.addArrayElement(chunk.getJSON());
    }
    return j;
}
