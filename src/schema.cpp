//*****************************************************************************
// Copyright 2025 Intel Corporation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//*****************************************************************************
#include "schema.hpp"

#include <string>
#include <utility>

#include <rapidjson/error/en.h>
#include <rapidjson/error/error.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>

#include "logging.hpp"
#include "status.hpp"

namespace nexus {
const std::string REGISTRY_SCHEMA = R"({
	"definitions": {
		"version_entry": {
			"type": "object",
			"required": ["storage_uri", "commit_hash", "file_size", "file_extension", "timestamp"],
			"properties": {
				"storage_uri": {
					"type": "string",
					"minLength": 1
				},
				"commit_hash": {
					"type": "string",
					"minLength": 1
				},
				"file_size": {
					"type": "integer",
					"minimum": 0
				},
				"file_extension": {
					"type": "string"
				},
				"timestamp": {
					"type": "string"
				}
			}
		},
		"model_versions": {
			"type": "object",
			"minProperties": 1,
			"additionalProperties": {
				"$ref": "#/definitions/version_entry"
			}
		}
	},
	"type": "object",
	"properties": {
		"models": {
			"type": "object",
			"additionalProperties": {
				"$ref": "#/definitions/model_versions"
			}
		},
		"latest": {
			"type": "object",
			"additionalProperties": {
				"type": "string",
				"minLength": 1
			}
		}
	},
	"additionalProperties": false
})";

const std::string CONTROL_PLANE_CONFIG_SCHEMA = R"({
	"type": "object",
	"properties": {
		"provider": {
			"type": "string"
		},
		"bucket": {
			"type": "string"
		},
		"region": {
			"type": "string"
		},
		"endpoint": {
			"type": "string"
		},
		"local_root": {
			"type": "string"
		}
	},
	"additionalProperties": false
})";

const std::string MODEL_DEFINITION_SCHEMA = R"({
	"type": "object",
	"required": ["type"],
	"properties": {
		"type": {
			"type": "string",
			"enum": ["linear", "sum"]
		},
		"weights": {
			"type": "array",
			"minItems": 1,
			"items": {
				"type": "number"
			}
		},
		"bias": {
			"type": "number"
		}
	}
})";

Status validateJsonAgainstSchema(rapidjson::Document& json, const char* schema, bool detailedError) {
    rapidjson::Document schemaJson;
    rapidjson::ParseResult parsingSucceeded = schemaJson.Parse(schema);
    if (parsingSucceeded.Code()) {
        std::string errorMsg = "JSON schema parse error:";
        errorMsg += rapidjson::GetParseError_En(parsingSucceeded.Code());
        errorMsg += ", at: ";
        errorMsg += std::to_string(parsingSucceeded.Offset());
        SPDLOG_ERROR("JSON schema parse error: {}, at: {}", rapidjson::GetParseError_En(parsingSucceeded.Code()), parsingSucceeded.Offset());
        return detailedError ? Status(StatusCode::JSON_INVALID, std::move(errorMsg)) : StatusCode::JSON_INVALID;
    }
    rapidjson::SchemaDocument parsedSchema(schemaJson);
    rapidjson::SchemaValidator validator(parsedSchema);
    if (!json.Accept(validator)) {
        rapidjson::StringBuffer sb;
        validator.GetInvalidSchemaPointer().StringifyUriFragment(sb);
        std::string invalidatingSchema = sb.GetString();
        std::string keyword = validator.GetInvalidSchemaKeyword();
        sb.Clear();
        validator.GetInvalidDocumentPointer().StringifyUriFragment(sb);
        std::string key = sb.GetString();

        std::string errorMsg = "JSON schema parse error:";
        errorMsg += invalidatingSchema;
        errorMsg += ". Keyword:";
        errorMsg += keyword;
        errorMsg += " Key: ";
        errorMsg += key;
        SPDLOG_ERROR(errorMsg);
        return detailedError ? Status(StatusCode::JSON_INVALID, std::move(errorMsg)) : StatusCode::JSON_INVALID;
    }

    return StatusCode::OK;
}

}  // namespace nexus
