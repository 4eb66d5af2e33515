#ifndef PL_SERIALIZED_HH
#define PL_SERIALIZED_HH

#include <qpdf/Pipeline.hh>
#include <qpdf/QPDFLogger.hh>

#include <memory>

// Passes each write and finish call on to another pipeline while holding a lock that all
// Pl_Serialized instances share, so that several threads may write to the same destination.
class Pl_Serialized: public Pipeline
{
  public:
    Pl_Serialized(char const* identifier, std::shared_ptr<Pipeline> next);
    ~Pl_Serialized() override = default;

    void write(unsigned char const* data, size_t len) override;
    void finish() override;

    // Route the info, warn and error channels of logger through Pl_Serialized instances. Channels
    // that are already serialized are left alone. Call this before handing the logger to
    // concurrent tasks.
    static void serialize(QPDFLogger& logger);

  private:
    std::shared_ptr<Pipeline> target;
};

#endif // PL_SERIALIZED_HH
