#include <docsift/Pl_Serialized.hh>

#include <mutex>
#include <stdexcept>

static std::mutex&
output_mutex()
{
    static std::mutex m;
    return m;
}

Pl_Serialized::Pl_Serialized(char const* identifier, std::shared_ptr<Pipeline> next) :
    Pipeline(identifier, next.get()),
    target(next)
{
    if (!next) {
        throw std::logic_error("Attempt to create Pl_Serialized with nullptr as next");
    }
}

void
Pl_Serialized::write(unsigned char const* data, size_t len)
{
    std::lock_guard<std::mutex> lock(output_mutex());
    target->write(data, len);
}

void
Pl_Serialized::finish()
{
    std::lock_guard<std::mutex> lock(output_mutex());
    target->finish();
}

static std::shared_ptr<Pipeline>
serialized(char const* identifier, std::shared_ptr<Pipeline> p)
{
    if (std::dynamic_pointer_cast<Pl_Serialized>(p)) {
        return p;
    }
    return std::make_shared<Pl_Serialized>(identifier, p);
}

void
Pl_Serialized::serialize(QPDFLogger& logger)
{
    // getWarn falls back to the error channel, so it must be read before error is replaced.
    auto warn = logger.getWarn();
    auto error = logger.getError();
    logger.setInfo(serialized("serialized info", logger.getInfo()));
    logger.setWarn(serialized("serialized warn", warn));
    logger.setError(serialized("serialized error", error));
}
