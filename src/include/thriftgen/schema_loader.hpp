#pragma once

#include <thriftgen/file_group.hpp>
#include <thriftgen/xml_reader.hpp>

namespace thriftgen {

  // Reads a schema interchange document, the XML rendering of a parsed and
  // validated set of Thrift files:
  //
  //   <file-group initial="tutorial">
  //     <schema module="tutorial" path="tutorial.thrift">
  //       <namespace language="cpp" value="tutorial"/>
  //       <struct name="Point">
  //         <field id="1" name="x" requiredness="required">
  //           <type><i32/></type>
  //         </field>
  //       </struct>
  //     </schema>
  //   </file-group>
  //
  // Throws std::runtime_error naming the offending line.
  class schema_loader {
  public:
    file_group
    load(xml_reader& reader);
  };

} // namespace thriftgen
