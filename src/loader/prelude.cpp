#include "recsyn/loader.hpp"

namespace recsyn {

// Only the surface the record matchers and fixtures touch.
const char* corlib_prelude(){
    return R"EDN(
(module :id "corlib"
  (type :ns "System" :name "Object" :kind class :known Object
    (method :name ".ctor" :ret void :access protected)
    (method :name "ToString" :ret string :access public :virtual true)
    (method :name "Equals" :ret bool :params [[obj object]] :access public :virtual true)
    (method :name "GetHashCode" :ret int :access public :virtual true))
  (type :ns "System" :name "ValueType" :kind class :known ValueType :base [object])
  (type :ns "System" :name "Void" :kind struct :known Void :base [System.ValueType])
  (type :ns "System" :name "Boolean" :kind struct :known Boolean :base [System.ValueType]
    (method :name "ToString" :ret string :access public :override true))
  (type :ns "System" :name "Int32" :kind struct :known Int32 :base [System.ValueType]
    (method :name "ToString" :ret string :access public :override true))
  (type :ns "System" :name "String" :kind class :known String :base [object]
    (method :name "ToString" :ret string :access public :override true))
  (type :ns "System" :name "RuntimeTypeHandle" :kind struct :known RuntimeTypeHandle :base [System.ValueType])
  (type :ns "System" :name "Type" :kind class :known Type :base [object]
    (method :name "GetTypeFromHandle" :ret System.Type :params [[handle System.RuntimeTypeHandle]] :access public :static true)
    (method :name "op_Equality" :ret bool :params [[left System.Type] [right System.Type]] :access public :static true :operator true)
    (method :name "op_Inequality" :ret bool :params [[left System.Type] [right System.Type]] :access public :static true :operator true))
  (type :ns "System" :name "IEquatable`1" :kind interface :known IEquatableOf1 :type-params [T]
    (method :name "Equals" :ret bool :params [[other T]] :access public :abstract true))
  (type :ns "System.Text" :name "StringBuilder" :kind class :known StringBuilder :base [object]
    (method :name ".ctor" :ret void :access public)
    (method :name "Append" :ret System.Text.StringBuilder :params [[value string]] :access public)
    (method :name "Append" :ret System.Text.StringBuilder :params [[value object]] :access public)
    (method :name "Append" :ret System.Text.StringBuilder :params [[value int]] :access public)
    (method :name "Append" :ret System.Text.StringBuilder :params [[value bool]] :access public)
    (method :name "ToString" :ret string :access public :override true))
  (type :ns "System.Collections.Generic" :name "EqualityComparer`1" :kind class :known EqualityComparerOf1
        :type-params [T] :base [object]
    (method :name "get_Default" :ret (inst System.Collections.Generic.EqualityComparer`1 T) :access public :static true)
    (method :name "Equals" :ret bool :params [[x T] [y T]] :access public :abstract true)
    (method :name "GetHashCode" :ret int :params [[obj T]] :access public :abstract true))
  (type :ns "System.Runtime.CompilerServices" :name "CompilerGeneratedAttribute" :kind class
        :known CompilerGeneratedAttribute :base [object]))
)EDN";
}

} // namespace recsyn
