#include <docsift/assert_test.h>

#include <docsift/Pl_Serialized.hh>

#include <qpdf/Pl_String.hh>
#include <qpdf/QPDFLogger.hh>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

static void
test_pass_through()
{
    std::string out;
    auto target = std::make_shared<Pl_String>("out", nullptr, out);
    Pl_Serialized p("serialized", target);
    p.writeString("one ");
    p << "two " << 3;
    p.finish();
    assert(out == "one two 3");

    try {
        Pl_Serialized bad("bad", nullptr);
        assert(false);
    } catch (std::logic_error&) {
    }
}

static void
test_serialize_logger()
{
    // The error channel is shared by warnings until warn is set separately.
    auto l = QPDFLogger::create();
    std::string info;
    std::string errors;
    auto pl_info = std::make_shared<Pl_String>("info", nullptr, info);
    l->setInfo(pl_info);
    l->setError(std::make_shared<Pl_String>("errors", nullptr, errors));
    Pl_Serialized::serialize(*l);
    assert(std::dynamic_pointer_cast<Pl_Serialized>(l->getInfo()));
    assert(std::dynamic_pointer_cast<Pl_Serialized>(l->getWarn()));
    assert(std::dynamic_pointer_cast<Pl_Serialized>(l->getError()));
    l->info("info\n");
    l->warn("warning\n");
    l->error("error\n");
    assert(info == "info\n");
    assert(errors == "warning\nerror\n");

    // Serializing again doesn't wrap twice.
    auto before = l->getInfo();
    Pl_Serialized::serialize(*l);
    assert(l->getInfo() == before);
    l->info("again\n");
    assert(info == "info\nagain\n");
}

static void
test_threads()
{
    // Messages from concurrent writers are never interleaved.
    auto l = QPDFLogger::create();
    std::string info;
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    Pl_Serialized::serialize(*l);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([l, t]() {
            std::string line(40, static_cast<char>('a' + t));
            for (int i = 0; i < 100; ++i) {
                l->info(line + "\n");
            }
        });
    }
    for (auto& thread: threads) {
        thread.join();
    }
    assert(info.size() == 4 * 100 * 41);
    for (size_t pos = 0; pos < info.size(); pos += 41) {
        assert(info.at(pos + 40) == '\n');
        assert(info.substr(pos, 40) == std::string(40, info.at(pos)));
    }
}

int
main()
{
    test_pass_through();
    test_serialize_logger();
    test_threads();
    std::cout << "end of logger tests\n";
    return 0;
}
