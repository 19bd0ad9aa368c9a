// Cancellation unwinds the classifier with operation_canceled.
#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "recsyn/record/record_decompiler.hpp"

using namespace recsyn;
using recsyn::record::RecordDecompiler;

namespace {

// Forwards to the loader and cancels `source` once `budget` bodies were produced.
class CancelAfter : public BodyDecompiler {
public:
    CancelAfter(BodyDecompiler& inner, CancellationSource& source, int budget) : inner_(inner), source_(source), budget_(budget) {}

    std::optional<il::NormalizedBody> decompile(MethodId method, const CancellationToken& token) override {
        auto body = inner_.decompile(method, token);
        ++calls;
        if(calls == budget_) source_.cancel();
        return body;
    }

    int calls = 0;

private:
    BodyDecompiler& inner_;
    CancellationSource& source_;
    int budget_;
};

class CancellationTest : public ::testing::Test {
protected:
    TypeSystem ts;
    ModuleLoader loader{ts};
    TypeDefId def = invalid_id;

    void SetUp() override { def = fixtures::load_type(loader, fixtures::point_module(), "Point"); }
};

} // namespace

TEST_F(CancellationTest, LoaderChecksTokenBeforeLowering){
    CancellationSource source;
    source.cancel();
    auto m = ts.find_method(def, "ToString", 0);
    ASSERT_TRUE(m);
    EXPECT_THROW(loader.decompile(*m, source.token()), operation_canceled);
}

TEST_F(CancellationTest, CanceledTokenStopsConstruction){
    CancellationSource source;
    source.cancel();
    EXPECT_THROW(RecordDecompiler(ts, def, loader, source.token(), ClassifyEnv{}), operation_canceled);
}

TEST_F(CancellationTest, CancelDuringAutoPropertyDetection){
    CancellationSource source;
    CancelAfter decompiler(loader, source, 1);
    EXPECT_THROW(RecordDecompiler(ts, def, decompiler, source.token(), ClassifyEnv{}), operation_canceled);
    EXPECT_EQ(decompiler.calls, 1);
}

TEST_F(CancellationTest, CancelAfterConstructionStopsMatchers){
    CancellationSource source;
    RecordDecompiler rd(ts, def, loader, source.token(), ClassifyEnv{});
    auto print = ts.find_method(def, "PrintMembers", 1);
    ASSERT_TRUE(print);
    EXPECT_TRUE(rd.method_is_generated(*print));

    source.cancel();
    EXPECT_THROW(rd.method_is_generated(*print), operation_canceled);
    EXPECT_THROW(rd.classify_all(), operation_canceled);
}

TEST_F(CancellationTest, CancelInsidePrintMembersLoop){
    CancellationSource source;
    // construction decompiles the accessors of EqualityContract, X and Y (five bodies);
    // the sixth is PrintMembers itself, so cancellation lands inside the member loop
    CancelAfter decompiler(loader, source, 6);
    RecordDecompiler rd(ts, def, decompiler, source.token(), ClassifyEnv{});
    ASSERT_EQ(decompiler.calls, 5);
    auto print = ts.find_method(def, "PrintMembers", 1);
    ASSERT_TRUE(print);
    EXPECT_THROW(rd.method_is_generated(*print), operation_canceled);
}

TEST_F(CancellationTest, UncanceledSourceClassifiesNormally){
    CancellationSource source;
    RecordDecompiler rd(ts, def, loader, source.token(), ClassifyEnv{});
    EXPECT_FALSE(source.is_cancellation_requested());
    EXPECT_EQ(rd.backing_fields().size(), 2u);
}
