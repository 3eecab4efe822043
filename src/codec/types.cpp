#include "jsonb/codec/types.hpp"

namespace jsonb::codec {

const char* element_type_name(ElementType t) noexcept {
  switch (t) {
    case ElementType::Null:
      return "null";
    case ElementType::True:
      return "true";
    case ElementType::False:
      return "false";
    case ElementType::Int:
      return "int";
    case ElementType::Int5:
      return "int5";
    case ElementType::Float:
      return "float";
    case ElementType::Float5:
      return "float5";
    case ElementType::Text:
      return "text";
    case ElementType::TextJ:
      return "textj";
    case ElementType::Text5:
      return "text5";
    case ElementType::TextRaw:
      return "textraw";
    case ElementType::Array:
      return "array";
    case ElementType::Object:
      return "object";
    case ElementType::Reserved13:
      return "reserved13";
    case ElementType::Reserved14:
      return "reserved14";
    case ElementType::Reserved15:
      return "reserved15";
  }
  return "unknown";
}

const char* shape_name(Shape s) noexcept {
  switch (s) {
    case Shape::Any:
      return "any";
    case Shape::Null:
      return "null";
    case Shape::Bool:
      return "bool";
    case Shape::I8:
      return "i8";
    case Shape::I16:
      return "i16";
    case Shape::I32:
      return "i32";
    case Shape::I64:
      return "i64";
    case Shape::U8:
      return "u8";
    case Shape::U16:
      return "u16";
    case Shape::U32:
      return "u32";
    case Shape::U64:
      return "u64";
    case Shape::F32:
      return "f32";
    case Shape::F64:
      return "f64";
    case Shape::String:
      return "string";
    case Shape::Array:
      return "array";
    case Shape::Object:
      return "object";
  }
  return "unknown";
}

bool shape_accepts(Shape expected, ElementType actual) noexcept {
  if (is_reserved(actual)) {
    return false;
  }
  switch (expected) {
    case Shape::Any:
      return true;
    case Shape::Null:
      return actual == ElementType::Null;
    case Shape::Bool:
      return actual == ElementType::True || actual == ElementType::False;
    case Shape::I8:
    case Shape::I16:
    case Shape::I32:
    case Shape::I64:
    case Shape::U8:
    case Shape::U16:
    case Shape::U32:
    case Shape::U64:
      return actual == ElementType::Int || actual == ElementType::Int5;
    case Shape::F32:
    case Shape::F64:
      return actual == ElementType::Float || actual == ElementType::Float5;
    case Shape::String:
      return is_text(actual);
    case Shape::Array:
      return actual == ElementType::Array;
    case Shape::Object:
      return actual == ElementType::Object;
  }
  return false;
}

}  // namespace jsonb::codec
