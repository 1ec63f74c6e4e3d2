#pragma once

namespace tabexport {
namespace render {

// 未指定 -s 时注入 <head> 的样式表
inline constexpr const char* kDefaultStylesheet = R"CSS(body {
    font-family: Arial, Helvetica, sans-serif;
    font-size: 10pt;
    background-color: #ffffff;
}
table {
    border-collapse: collapse;
    margin-bottom: 12px;
}
th {
    font-weight: bold;
    background-color: #d9d9d9;
    border: 1px solid #808080;
    padding: 2px 6px;
}
th.title {
    font-size: 14pt;
    text-decoration: underline;
    background-color: #ffffff;
    border: none;
}
td {
    border: 1px solid #c0c0c0;
    padding: 2px 6px;
}
)CSS";

}} // namespace tabexport::render
