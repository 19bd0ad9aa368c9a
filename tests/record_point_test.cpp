// Classification of the synthesized members of record Point(int X, int Y).
#include <gtest/gtest.h>

#include <map>

#include "fixtures.hpp"
#include "recsyn/record/record_decompiler.hpp"

using namespace recsyn;
using recsyn::record::RecordDecompiler;

namespace {

class PointRecordTest : public ::testing::Test {
protected:
    TypeSystem ts;
    ModuleLoader loader{ts};

    TypeDefId load(const std::string& src){ return fixtures::load_type(loader, src, "Point"); }

    MethodId method(TypeDefId def, const std::string& name, size_t params){
        auto m = ts.find_method(def, name, params);
        EXPECT_TRUE(m.has_value()) << name;
        return m.value_or(invalid_id);
    }
    // Equals overload selected by its parameter: object or the record itself
    MethodId equals_of(TypeDefId def, bool object_param){
        for(auto id : ts.definition(def).methods){
            const auto& m = ts.method(id);
            if(m.name == "Equals" && m.params.size() == 1 && ts.is_known(m.params[0].type, KnownTypeCode::Object) == object_param)
                return id;
        }
        ADD_FAILURE() << "Equals overload missing";
        return invalid_id;
    }

    static std::map<std::string, bool> verdicts(const TypeSystem& types, const RecordDecompiler& rd){
        std::map<std::string, bool> out;
        for(auto& v : rd.classify_all()){
            std::string key = v.name;
            if(v.name == "Equals"){
                bool obj = types.is_known(types.method(v.member.id).params[0].type, KnownTypeCode::Object);
                key += obj ? "(object)" : "(Point)";
            }
            if(v.name == ".ctor") key += "/" + std::to_string(types.method(v.member.id).params.size());
            out[key] = v.generated;
        }
        return out;
    }
};

} // namespace

TEST_F(PointRecordTest, AllSynthesizedMembersAreGenerated){
    auto def = load(fixtures::point_module());
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    EXPECT_FALSE(rd.is_inherited_record());

    auto eq_contract = ts.find_property(def, "EqualityContract");
    ASSERT_TRUE(eq_contract);
    EXPECT_TRUE(rd.property_is_generated(*eq_contract));
    EXPECT_TRUE(rd.method_is_generated(method(def, "PrintMembers", 1)));
    EXPECT_TRUE(rd.method_is_generated(method(def, "ToString", 0)));
    EXPECT_TRUE(rd.method_is_generated(equals_of(def, false)));
    EXPECT_TRUE(rd.method_is_generated(equals_of(def, true)));
    EXPECT_TRUE(rd.method_is_generated(method(def, "op_Equality", 2)));
    EXPECT_TRUE(rd.method_is_generated(method(def, "op_Inequality", 2)));
    EXPECT_TRUE(rd.method_is_generated(method(def, "<Clone>$", 0)));
    EXPECT_TRUE(rd.method_is_generated(method(def, "GetHashCode", 0)));

    // accessors and constructors are ordinary members
    EXPECT_FALSE(rd.method_is_generated(method(def, "get_X", 0)));
    EXPECT_FALSE(rd.method_is_generated(method(def, ".ctor", 2)));
    auto x = ts.find_property(def, "X");
    ASSERT_TRUE(x);
    EXPECT_FALSE(rd.property_is_generated(*x));
}

TEST_F(PointRecordTest, BackingFieldMapHoldsExactlyXAndY){
    auto def = load(fixtures::point_module());
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    const auto& map = rd.backing_fields();
    ASSERT_EQ(map.size(), 2u);
    auto x = *ts.find_property(def, "X");
    auto y = *ts.find_property(def, "Y");
    auto bx = *ts.find_field(def, "<X>k__BackingField");
    auto by = *ts.find_field(def, "<Y>k__BackingField");
    EXPECT_EQ(map.field_of(x).value_or(invalid_id), bx);
    EXPECT_EQ(map.field_of(y).value_or(invalid_id), by);
    EXPECT_EQ(map.property_of(bx).value_or(invalid_id), x);
    EXPECT_EQ(map.property_of(by).value_or(invalid_id), y);
    EXPECT_FALSE(map.field_of(*ts.find_property(def, "EqualityContract")));

    ASSERT_TRUE(rd.ordered_members());
    ASSERT_EQ(rd.ordered_members()->size(), 3u);
    EXPECT_TRUE((*rd.ordered_members())[1] == (SymbolRef{SymbolKind::Property, x}));
}

TEST_F(PointRecordTest, ClassificationIsIdempotent){
    auto def = load(fixtures::point_module());
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    auto first = verdicts(ts, rd);
    auto second = verdicts(ts, rd);
    EXPECT_EQ(first, second);
    auto print = method(def, "PrintMembers", 1);
    for(int i = 0; i < 3; ++i) EXPECT_TRUE(rd.method_is_generated(print));
}

TEST_F(PointRecordTest, SeparatorPerturbationFlipsOnlyPrintMembers){
    auto baseline_def = load(fixtures::point_module());
    RecordDecompiler baseline(ts, baseline_def, loader, CancellationToken{}, ClassifyEnv{});
    auto expected = verdicts(ts, baseline);
    ASSERT_TRUE(expected["PrintMembers"]);

    TypeSystem ts2;
    ModuleLoader loader2(ts2);
    auto src = fixtures::replace_once(fixtures::point_module(), "(ldstr \", \")", "(ldstr \",\")");
    auto def = fixtures::load_type(loader2, src, "Point");
    RecordDecompiler rd(ts2, def, loader2, CancellationToken{}, ClassifyEnv{});
    auto actual = verdicts(ts2, rd);

    expected["PrintMembers"] = false;
    EXPECT_EQ(actual, expected);
}

TEST_F(PointRecordTest, PerturbedLiteralsAreHandWritten){
    struct Case { const char* from; const char* to; const char* member; };
    const Case cases[] = {
        {"(ldstr \"X = \")", "(ldstr \"X: \")", "PrintMembers"},
        {"(ret (ldc.i4 1))", "(ret (ldc.i4 0))", "PrintMembers"},
        {"(ldstr \" { \")", "(ldstr \"{ \")", "ToString"},
        {"(ldstr \"Point\")", "(ldstr \"P\")", "ToString"},
        {"(ldc.i4 -1521134295)", "(ldc.i4 31)", "GetHashCode"},
    };
    for(const auto& c : cases){
        TypeSystem local;
        ModuleLoader local_loader(local);
        auto def = fixtures::load_type(local_loader, fixtures::replace_once(fixtures::point_module(), c.from, c.to), "Point");
        RecordDecompiler rd(local, def, local_loader, CancellationToken{}, ClassifyEnv{});
        auto id = local.find_method(def, c.member);
        ASSERT_TRUE(id) << c.member;
        EXPECT_FALSE(rd.method_is_generated(*id)) << c.from << " -> " << c.to;
    }
}

TEST_F(PointRecordTest, SplitLabelAppendsStillMatch){
    // the compiler may emit the name and " = " as two appends
    auto src = fixtures::replace_once(fixtures::point_module(),
        "(callvirt [System.Text.StringBuilder Append string] (ldloc builder) (ldstr \"X = \"))",
        "(callvirt [System.Text.StringBuilder Append string] (ldloc builder) (ldstr \"X\"))\n"
        "(callvirt [System.Text.StringBuilder Append string] (ldloc builder) (ldstr \" = \"))");
    auto def = load(src);
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    EXPECT_TRUE(rd.method_is_generated(method(def, "PrintMembers", 1)));
}

TEST_F(PointRecordTest, ManualFieldMakesOrderUnknown){
    auto src = fixtures::add_members(fixtures::point_module(),
        "(type :name \"Point\" :kind class :base [object (inst System.IEquatable`1 Point)]",
        "(field :name \"Tag\" :type int :access public)");
    auto def = load(src);
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    EXPECT_FALSE(rd.ordered_members().has_value());
    EXPECT_EQ(rd.backing_fields().size(), 2u);

    EXPECT_FALSE(rd.method_is_generated(method(def, "PrintMembers", 1)));
    EXPECT_FALSE(rd.method_is_generated(equals_of(def, false)));
    EXPECT_TRUE(rd.property_is_generated(*ts.find_property(def, "EqualityContract")));
    EXPECT_TRUE(rd.method_is_generated(method(def, "op_Equality", 2)));
    EXPECT_TRUE(rd.method_is_generated(method(def, "op_Inequality", 2)));
}

TEST_F(PointRecordTest, EqualsObjectIgnoresItsBody){
    auto src = fixtures::replace_once(fixtures::point_module(),
        ":override true\n      :body [(ret (callvirt [Point Equals Point] (ldloc this) ldnull))]",
        ":override true\n      :body [nop (ldc.i4 42) (ldstr \"not a return\")]");
    auto def = load(src);
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    EXPECT_TRUE(rd.method_is_generated(equals_of(def, true)));
}

TEST_F(PointRecordTest, EqualsObjectWithoutBodyIsGenerated){
    auto src = fixtures::replace_once(fixtures::point_module(),
        ":override true\n      :body [(ret (callvirt [Point Equals Point] (ldloc this) ldnull))]",
        ":override true :abstract true");
    auto def = load(src);
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    auto id = equals_of(def, true);
    EXPECT_FALSE(ts.method(id).has_body);
    EXPECT_TRUE(rd.method_is_generated(id));
}

TEST_F(PointRecordTest, UserOperatorWithOtherParameterTypeIsNotGenerated){
    auto src = fixtures::add_members(fixtures::point_module(),
        "(type :name \"Point\" :kind class :base [object (inst System.IEquatable`1 Point)]",
        "(method :name \"op_Equality\" :ret bool :params [[left Point] [right int]] :access public :static true\n"
        "  :body [(ret (ldc.i4 0))])");
    auto def = load(src);
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    int generated = 0, user = 0;
    for(auto id : ts.definition(def).methods){
        if(ts.method(id).name != "op_Equality") continue;
        (rd.method_is_generated(id) ? generated : user)++;
    }
    EXPECT_EQ(generated, 1);
    EXPECT_EQ(user, 1);
}

TEST_F(PointRecordTest, SealedOrAttributedMembersAreHandWritten){
    auto src = fixtures::replace_once(fixtures::point_module(),
        "(method :name \"ToString\" :ret string :access public :override true",
        "(method :name \"ToString\" :ret string :access public :override true :sealed true");
    src = fixtures::replace_once(src,
        "(method :name \"PrintMembers\" :ret bool :params [[builder System.Text.StringBuilder]] :access protected :virtual true",
        "(method :name \"PrintMembers\" :ret bool :params [[builder System.Text.StringBuilder]] :access protected :virtual true :attrs [CompilerGenerated]");
    auto def = load(src);
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    EXPECT_FALSE(rd.method_is_generated(method(def, "ToString", 0)));
    EXPECT_FALSE(rd.method_is_generated(method(def, "PrintMembers", 1)));
    EXPECT_TRUE(rd.method_is_generated(equals_of(def, false)));
}

TEST_F(PointRecordTest, EqualityContractShapeIsStrict){
    struct Case { const char* from; const char* to; };
    const Case cases[] = {
        // public instead of protected
        {"(property :name \"EqualityContract\" :type System.Type :get get_EqualityContract :access protected)",
         "(property :name \"EqualityContract\" :type System.Type :get get_EqualityContract :access public)"},
        // typeof(object)
        {"(ldtypetoken Point)", "(ldtypetoken object)"},
        // missing [CompilerGenerated] on the getter
        {":access protected :virtual true :attrs [CompilerGenerated]\n      :body [(ret (call [System.Type GetTypeFromHandle]",
         ":access protected :virtual true\n      :body [(ret (call [System.Type GetTypeFromHandle]"},
    };
    for(const auto& c : cases){
        TypeSystem local;
        ModuleLoader local_loader(local);
        auto def = fixtures::load_type(local_loader, fixtures::replace_once(fixtures::point_module(), c.from, c.to), "Point");
        RecordDecompiler rd(local, def, local_loader, CancellationToken{}, ClassifyEnv{});
        EXPECT_FALSE(rd.property_is_generated(*local.find_property(def, "EqualityContract"))) << c.to;
    }
}

TEST_F(PointRecordTest, RecordCandidateNeedsCloneMethod){
    auto def = load(fixtures::point_module());
    EXPECT_TRUE(record::is_record_candidate(ts, def));
    auto obj = ts.find_definition("System.Object");
    ASSERT_TRUE(obj);
    EXPECT_FALSE(record::is_record_candidate(ts, *obj));
}

TEST_F(PointRecordTest, AccessorWithTrailingStatementIsNotAutomatic){
    struct Case { const char* from; const char* to; };
    const Case cases[] = {
        {"(ret (ldfld <X>k__BackingField (ldloc this)))])", "(ret (ldfld <X>k__BackingField (ldloc this))) (ldc.i4 7)])"},
        {"(stfld <X>k__BackingField (ldloc this) (ldloc value)) ret])", "(stfld <X>k__BackingField (ldloc this) (ldloc value)) ret (ldc.i4 7)])"},
    };
    for(auto& c : cases){
        TypeSystem types;
        ModuleLoader ldr(types);
        auto def = fixtures::load_type(ldr, fixtures::replace_once(fixtures::point_module(), c.from, c.to), "Point");
        RecordDecompiler rd(types, def, ldr, CancellationToken{}, ClassifyEnv{});
        auto x = types.find_property(def, "X");
        auto y = types.find_property(def, "Y");
        ASSERT_TRUE(x && y);
        EXPECT_FALSE(rd.backing_fields().field_of(*x).has_value()) << c.to;
        EXPECT_TRUE(rd.backing_fields().field_of(*y).has_value()) << c.to;
        // <X>k__BackingField no longer backs a property
        EXPECT_FALSE(rd.ordered_members().has_value()) << c.to;
    }
}

TEST_F(PointRecordTest, PrintMembersEndsAtItsReturn){
    auto src = fixtures::replace_once(fixtures::point_module(), "(ret (ldc.i4 1))])", "(ret (ldc.i4 1)) (ldc.i4 7)])");
    auto def = load(src);
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    EXPECT_FALSE(rd.method_is_generated(method(def, "PrintMembers", 1)));
    EXPECT_TRUE(rd.method_is_generated(method(def, "ToString", 0)));
}

namespace {
const char* kToStringPrintMembersStep =
    "(if (callvirt [Point PrintMembers] (ldloc this) (ldloc sb))\n"
    "                 (block (callvirt [System.Text.StringBuilder Append string] (ldloc sb) (ldstr \" \"))))";
} // namespace

TEST_F(PointRecordTest, ToStringWithoutPrintMembersStepIsGenerated){
    auto def = load(fixtures::replace_once(fixtures::point_module(), kToStringPrintMembersStep, "nop"));
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    EXPECT_TRUE(rd.method_is_generated(method(def, "ToString", 0)));
}

TEST_F(PointRecordTest, ToStringWithoutPrintMembersStepStillChecksTail){
    auto src = fixtures::replace_once(fixtures::point_module(), kToStringPrintMembersStep, "nop");
    src = fixtures::replace_once(src, "(ldstr \"}\")", "(ldstr \" }\")");
    auto def = load(src);
    RecordDecompiler rd(ts, def, loader, CancellationToken{}, ClassifyEnv{});
    EXPECT_FALSE(rd.method_is_generated(method(def, "ToString", 0)));
}
