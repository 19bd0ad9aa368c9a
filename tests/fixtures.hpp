// Inline EDN modules shared by the record tests.
#pragma once
#include <stdexcept>
#include <string>

#include "recsyn/loader.hpp"

namespace fixtures {

// record Point(int X, int Y), as emitted by the C# compiler.
inline const char* point_module(){
    return R"EDN(
(module :id "point"
  (type :name "Point" :kind class :base [object (inst System.IEquatable`1 Point)]
    (field :name "<X>k__BackingField" :type int :access private :readonly true :attrs [CompilerGenerated])
    (field :name "<Y>k__BackingField" :type int :access private :readonly true :attrs [CompilerGenerated])

    (method :name ".ctor" :params [[X int] [Y int]] :access public
      :body [(stfld <X>k__BackingField (ldloc this) (ldloc X))
             (stfld <Y>k__BackingField (ldloc this) (ldloc Y))
             (call [object ".ctor"] (ldloc this))
             ret])
    (method :name ".ctor" :params [[original Point]] :access protected
      :body [(call [object ".ctor"] (ldloc this))
             (stfld <X>k__BackingField (ldloc this) (ldfld <X>k__BackingField (ldloc original)))
             (stfld <Y>k__BackingField (ldloc this) (ldfld <Y>k__BackingField (ldloc original)))
             ret])

    (method :name "get_EqualityContract" :ret System.Type :access protected :virtual true :attrs [CompilerGenerated]
      :body [(ret (call [System.Type GetTypeFromHandle] (ldtypetoken Point)))])
    (method :name "get_X" :ret int :access public :attrs [CompilerGenerated]
      :body [(ret (ldfld <X>k__BackingField (ldloc this)))])
    (method :name "set_X" :params [[value int]] :access public :attrs [CompilerGenerated]
      :body [(stfld <X>k__BackingField (ldloc this) (ldloc value)) ret])
    (method :name "get_Y" :ret int :access public :attrs [CompilerGenerated]
      :body [(ret (ldfld <Y>k__BackingField (ldloc this)))])
    (method :name "set_Y" :params [[value int]] :access public :attrs [CompilerGenerated]
      :body [(stfld <Y>k__BackingField (ldloc this) (ldloc value)) ret])

    (method :name "ToString" :ret string :access public :override true
      :locals [[sb System.Text.StringBuilder]]
      :body [(stloc sb (newobj [System.Text.StringBuilder ".ctor"]))
             (callvirt [System.Text.StringBuilder Append string] (ldloc sb) (ldstr "Point"))
             (callvirt [System.Text.StringBuilder Append string] (ldloc sb) (ldstr " { "))
             (if (callvirt [Point PrintMembers] (ldloc this) (ldloc sb))
                 (block (callvirt [System.Text.StringBuilder Append string] (ldloc sb) (ldstr " "))))
             (callvirt [System.Text.StringBuilder Append string] (ldloc sb) (ldstr "}"))
             (ret (callvirt [System.Text.StringBuilder ToString] (ldloc sb)))])

    (method :name "PrintMembers" :ret bool :params [[builder System.Text.StringBuilder]] :access protected :virtual true
      :body [(callvirt [System.Text.StringBuilder Append string] (ldloc builder) (ldstr "X = "))
             (callvirt [System.Text.StringBuilder Append string] (ldloc builder)
                       (callvirt [int ToString] (addressof (call [Point get_X] (ldloc this)) :type int) :constrained int))
             (callvirt [System.Text.StringBuilder Append string] (ldloc builder) (ldstr ", "))
             (callvirt [System.Text.StringBuilder Append string] (ldloc builder) (ldstr "Y = "))
             (callvirt [System.Text.StringBuilder Append string] (ldloc builder)
                       (callvirt [int ToString] (addressof (call [Point get_Y] (ldloc this)) :type int) :constrained int))
             (ret (ldc.i4 1))])

    (method :name "op_Inequality" :ret bool :params [[left (? Point)] [right (? Point)]] :access public :static true
      :body [(ret (comp == (call [Point op_Equality Point Point] (ldloc left) (ldloc right)) (ldc.i4 0)))])
    (method :name "op_Equality" :ret bool :params [[left (? Point)] [right (? Point)]] :access public :static true
      :body [(ret (comp == (ldloc left) (ldloc right)))])

    (method :name "GetHashCode" :ret int :access public :override true
      :body [(ret (binary add
                    (binary mul
                      (binary add
                        (binary mul
                          (callvirt [(inst System.Collections.Generic.EqualityComparer`1 System.Type) GetHashCode T]
                                    (call [(inst System.Collections.Generic.EqualityComparer`1 System.Type) get_Default])
                                    (callvirt [Point get_EqualityContract] (ldloc this)))
                          (ldc.i4 -1521134295))
                        (callvirt [(inst System.Collections.Generic.EqualityComparer`1 int) GetHashCode T]
                                  (call [(inst System.Collections.Generic.EqualityComparer`1 int) get_Default])
                                  (ldfld <X>k__BackingField (ldloc this))))
                      (ldc.i4 -1521134295))
                    (callvirt [(inst System.Collections.Generic.EqualityComparer`1 int) GetHashCode T]
                              (call [(inst System.Collections.Generic.EqualityComparer`1 int) get_Default])
                              (ldfld <Y>k__BackingField (ldloc this)))))])

    (method :name "Equals" :ret bool :params [[obj (? object)]] :access public :override true
      :body [(ret (callvirt [Point Equals Point] (ldloc this) ldnull))])
    (method :name "Equals" :ret bool :params [[other (? Point)]] :access public :virtual true
      :body [(ret (logic.and
                    (logic.and
                      (logic.and
                        (comp != (ldloc other) ldnull)
                        (call [System.Type op_Equality]
                              (callvirt [Point get_EqualityContract] (ldloc this))
                              (callvirt [Point get_EqualityContract] (ldloc other))))
                      (callvirt [(inst System.Collections.Generic.EqualityComparer`1 int) Equals T T]
                                (call [(inst System.Collections.Generic.EqualityComparer`1 int) get_Default])
                                (ldfld <X>k__BackingField (ldloc this))
                                (ldfld <X>k__BackingField (ldloc other))))
                    (callvirt [(inst System.Collections.Generic.EqualityComparer`1 int) Equals T T]
                              (call [(inst System.Collections.Generic.EqualityComparer`1 int) get_Default])
                              (ldfld <Y>k__BackingField (ldloc this))
                              (ldfld <Y>k__BackingField (ldloc other)))))])

    (method :name "<Clone>$" :ret Point :access public :virtual true
      :body [(ret (newobj [Point ".ctor" Point] (ldloc this)))])

    (property :name "EqualityContract" :type System.Type :get get_EqualityContract :access protected)
    (property :name "X" :type int :get get_X :set set_X :access public)
    (property :name "Y" :type int :get get_Y :set set_Y :access public)))
)EDN";
}

// record Point3(int X, int Y, int Z) : Point(X, Y); load after point_module().
inline const char* point3_module(){
    return R"EDN(
(module :id "point3"
  (type :name "Point3" :kind class :base [Point (inst System.IEquatable`1 Point3)]
    (field :name "<Z>k__BackingField" :type int :access private :readonly true :attrs [CompilerGenerated])
    (method :name "get_EqualityContract" :ret System.Type :access protected :override true :attrs [CompilerGenerated]
      :body [(ret (call [System.Type GetTypeFromHandle] (ldtypetoken Point3)))])
    (method :name "get_Z" :ret int :access public :attrs [CompilerGenerated]
      :body [(ret (ldfld <Z>k__BackingField (ldloc this)))])
    (method :name "set_Z" :params [[value int]] :access public :attrs [CompilerGenerated]
      :body [(stfld <Z>k__BackingField (ldloc this) (ldloc value)) ret])
    (method :name "PrintMembers" :ret bool :params [[builder System.Text.StringBuilder]] :access protected :override true
      :body [(if (call [Point PrintMembers] (ldloc this) (ldloc builder))
                 (block (callvirt [System.Text.StringBuilder Append string] (ldloc builder) (ldstr ", "))))
             (callvirt [System.Text.StringBuilder Append string] (ldloc builder) (ldstr "Z = "))
             (callvirt [System.Text.StringBuilder Append string] (ldloc builder)
                       (callvirt [int ToString] (addressof (call [Point3 get_Z] (ldloc this)) :type int) :constrained int))
             (ret (ldc.i4 1))])
    (method :name "GetHashCode" :ret int :access public :override true
      :body [(ret (binary add
                    (binary mul (call [Point GetHashCode] (ldloc this)) (ldc.i4 -1521134295))
                    (callvirt [(inst System.Collections.Generic.EqualityComparer`1 int) GetHashCode T]
                              (call [(inst System.Collections.Generic.EqualityComparer`1 int) get_Default])
                              (ldfld <Z>k__BackingField (ldloc this)))))])
    (method :name "Equals" :ret bool :params [[other (? Point3)]] :access public :virtual true
      :body [(ret (logic.and
                    (call [Point Equals Point] (ldloc this) (ldloc other))
                    (callvirt [(inst System.Collections.Generic.EqualityComparer`1 int) Equals T T]
                              (call [(inst System.Collections.Generic.EqualityComparer`1 int) get_Default])
                              (ldfld <Z>k__BackingField (ldloc this))
                              (ldfld <Z>k__BackingField (ldloc other)))))])
    (method :name "<Clone>$" :ret Point :access public :override true
      :body [(ret (ldloc this))])
    (property :name "EqualityContract" :type System.Type :get get_EqualityContract :access protected)
    (property :name "Z" :type int :get get_Z :set set_Z :access public)))
)EDN";
}

// record Box<T>(T Value) with a static auto-property Count.
inline const char* box_module(){
    return R"EDN(
(module :id "box"
  (type :name "Box`1" :kind class :type-params [T] :base [object]
    (field :name "<Value>k__BackingField" :type T :access private :readonly true :attrs [CompilerGenerated])
    (field :name "<Count>k__BackingField" :type int :access private :static true :attrs [CompilerGenerated])
    (method :name "get_EqualityContract" :ret System.Type :access protected :virtual true :attrs [CompilerGenerated]
      :body [(ret (call [System.Type GetTypeFromHandle] (ldtypetoken (inst Box`1 T))))])
    (method :name "get_Value" :ret T :access public :attrs [CompilerGenerated]
      :body [(ret (ldfld [(inst Box`1 T) <Value>k__BackingField] (ldloc this)))])
    (method :name "set_Value" :params [[value T]] :access public :attrs [CompilerGenerated]
      :body [(stfld [(inst Box`1 T) <Value>k__BackingField] (ldloc this) (ldloc value)) ret])
    (method :name "get_Count" :ret int :access public :static true :attrs [CompilerGenerated]
      :body [(ret (ldsfld <Count>k__BackingField))])
    (method :name "set_Count" :params [[value int]] :access public :static true :attrs [CompilerGenerated]
      :body [(stsfld <Count>k__BackingField (ldloc value)) ret])
    (method :name "ToString" :ret string :access public :override true
      :locals [[sb System.Text.StringBuilder]]
      :body [(stloc sb (newobj [System.Text.StringBuilder ".ctor"]))
             (callvirt [System.Text.StringBuilder Append string] (ldloc sb) (ldstr "Box"))
             (callvirt [System.Text.StringBuilder Append string] (ldloc sb) (ldstr " { "))
             (if (callvirt [(inst Box`1 T) PrintMembers] (ldloc this) (ldloc sb))
                 (block (callvirt [System.Text.StringBuilder Append string] (ldloc sb) (ldstr " "))))
             (callvirt [System.Text.StringBuilder Append string] (ldloc sb) (ldstr "}"))
             (ret (callvirt [System.Text.StringBuilder ToString] (ldloc sb)))])
    (method :name "PrintMembers" :ret bool :params [[builder System.Text.StringBuilder]] :access protected :virtual true
      :body [(callvirt [System.Text.StringBuilder Append string] (ldloc builder) (ldstr "Value = "))
             (callvirt [System.Text.StringBuilder Append object] (ldloc builder)
                       (call [(inst Box`1 T) get_Value] (ldloc this)))
             (ret (ldc.i4 1))])
    (method :name "Equals" :ret bool :params [[other (? (inst Box`1 T))]] :access public :virtual true
      :body [(ret (logic.and
                    (logic.and
                      (comp != (ldloc other) ldnull)
                      (call [System.Type op_Equality]
                            (callvirt [(inst Box`1 T) get_EqualityContract] (ldloc this))
                            (callvirt [(inst Box`1 T) get_EqualityContract] (ldloc other))))
                    (callvirt [(inst System.Collections.Generic.EqualityComparer`1 T) Equals T T]
                              (call [(inst System.Collections.Generic.EqualityComparer`1 T) get_Default])
                              (ldfld [(inst Box`1 T) <Value>k__BackingField] (ldloc this))
                              (ldfld [(inst Box`1 T) <Value>k__BackingField] (ldloc other)))))])
    (method :name "op_Equality" :ret bool :params [[left (inst Box`1 T)] [right (inst Box`1 T)]] :access public :static true
      :body [(ret (comp == (ldloc left) (ldloc right)))])
    (method :name "op_Inequality" :ret bool :params [[left (inst Box`1 int)] [right (inst Box`1 int)]] :access public :static true
      :body [(ret (comp != (ldloc left) (ldloc right)))])
    (method :name "<Clone>$" :ret (inst Box`1 T) :access public :virtual true
      :body [(ret (ldloc this))])
    (property :name "EqualityContract" :type System.Type :get get_EqualityContract :access protected)
    (property :name "Value" :type T :get get_Value :set set_Value :access public)
    (property :name "Count" :type int :get get_Count :set set_Count :access public :static true)))
)EDN";
}

// Replaces the first occurrence of `from`; throws when it is missing so a
// stale perturbation cannot silently test the unmodified fixture.
inline std::string replace_once(std::string src, const std::string& from, const std::string& to){
    auto pos = src.find(from);
    if(pos == std::string::npos) throw std::invalid_argument("fixture text not found: " + from);
    return src.replace(pos, from.size(), to);
}

// Inserts member forms right after the opening of the first (type ...) form.
inline std::string add_members(std::string src, const std::string& type_header, const std::string& members){
    auto pos = src.find(type_header);
    if(pos == std::string::npos) throw std::invalid_argument("fixture type not found: " + type_header);
    return src.insert(pos + type_header.size(), "\n" + members);
}

// Loads `src` and returns the id of the named type; throws on load errors.
inline recsyn::TypeDefId load_type(recsyn::ModuleLoader& loader, const std::string& src, const std::string& name){
    auto res = loader.load(src);
    if(!res.success){
        std::string msg = "fixture failed to load";
        for(auto& e : res.errors) msg += "\n  " + e.code + ": " + e.message + " (line " + std::to_string(e.line) + ")";
        throw std::runtime_error(msg);
    }
    auto id = loader.type_system().find_definition(name);
    if(!id) throw std::runtime_error("fixture type missing: " + name);
    return *id;
}

} // namespace fixtures
