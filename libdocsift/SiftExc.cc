#include <docsift/SiftExc.hh>

SiftExc::SiftExc(
    docsift_error_code_e error_code,
    std::string const& filename,
    std::string const& object,
    docsift_offset_t offset,
    std::string const& message) :
    std::runtime_error(createWhat(filename, object, (offset ? offset : -1), message)),
    error_code(error_code),
    filename(filename),
    object(object),
    offset(offset ? offset : -1),
    message(message)
{
}

std::string
SiftExc::createWhat(
    std::string const& filename,
    std::string const& object,
    docsift_offset_t offset,
    std::string const& message)
{
    std::string result;
    if (!filename.empty()) {
        result += filename;
    }
    if (!(object.empty() && offset < 0)) {
        if (!filename.empty()) {
            result += " (";
        }
        if (!object.empty()) {
            result += object;
            if (offset >= 0) {
                result += ", ";
            }
        }
        if (offset >= 0) {
            result += "offset " + std::to_string(offset);
        }
        if (!filename.empty()) {
            result += ")";
        }
    }
    if (!result.empty()) {
        result += ": ";
    }
    result += message;
    return result;
}

docsift_error_code_e
SiftExc::getErrorCode() const
{
    return error_code;
}

std::string const&
SiftExc::getFilename() const
{
    return filename;
}

std::string const&
SiftExc::getObject() const
{
    return object;
}

docsift_offset_t
SiftExc::getFilePosition() const
{
    return offset < 0 ? 0 : offset;
}

std::string const&
SiftExc::getMessageDetail() const
{
    return message;
}

SiftUsage::SiftUsage(std::string const& msg) :
    std::runtime_error(msg)
{
}
